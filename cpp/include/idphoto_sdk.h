/**
 * @file idphoto_sdk.h
 * @brief IdPhotoSDK - Main header file
 *
 * Document-compliant face crop and positioning engine for ID photos
 *
 * @version 0.1.0
 * @copyright 2026
 */

#ifndef IDPHOTO_SDK_H
#define IDPHOTO_SDK_H

// Version info
#define IDPHOTO_SDK_VERSION_MAJOR 0
#define IDPHOTO_SDK_VERSION_MINOR 1
#define IDPHOTO_SDK_VERSION_PATCH 0
#define IDPHOTO_SDK_VERSION_STRING "0.1.0"

#include "idphoto_sdk/types.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/document_spec.h"
#include "idphoto_sdk/crop_engine.h"

namespace idphoto_sdk {

/**
 * @brief Get SDK version string
 * @return Version string (e.g., "0.1.0")
 */
IDPHOTO_SDK_EXPORT const char* get_version();

} // namespace idphoto_sdk

#endif // IDPHOTO_SDK_H
