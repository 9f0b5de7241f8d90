// Minimal linkage check
#include <iostream>

#include "idphoto_sdk.h"

int main() {
    std::cout << "IdPhotoSDK v" << idphoto_sdk::get_version() << std::endl;
    std::cout << "Built-in document specs: "
              << idphoto_sdk::DocumentSpecCatalog::builtin().size() << std::endl;
    return 0;
}
