/**
 * @file crop_demo.cpp
 * @brief 사진 한 장을 문서 규격에 맞게 잘라 저장하는 데모
 *
 * 외부 검출기가 저장한 랜드마크(YAML/JSON)와 선택적 분할 마스크를 읽어
 * CropEngine 으로 배율과 크롭 사각형을 계산한 뒤, 결과를 적용한 사진을 저장한다.
 *
 * 사용법:
 *   crop_demo <image> <landmarks.yaml> <country> <document> [output.png] [mask.png] [specs.yaml]
 *
 * 랜드마크 파일 형식 (cv::FileStorage):
 *   landmarks: N x 3 CV_32F 행렬 (정규화 x, y, z)
 */

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "idphoto_sdk.h"

namespace fs = std::filesystem;

namespace idphoto_sdk {

/**
 * @brief 랜드마크 파일 로드
 * @return 로드 성공 여부
 */
bool loadLandmarks(const std::string& path, std::vector<FaceLandmark>& mesh) {
    cv::Mat points;
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[CropDemo] 랜드마크 파일을 열 수 없습니다: " << path << "\n";
            return false;
        }
        fs["landmarks"] >> points;
    } catch (const cv::Exception& e) {
        std::cerr << "[CropDemo] 랜드마크 파일 파싱 실패: " << e.what() << "\n";
        return false;
    }

    if (points.empty() || points.cols != 3 || points.channels() != 1) {
        std::cerr << "[CropDemo] landmarks 는 N x 3 행렬이어야 합니다\n";
        return false;
    }

    cv::Mat points_f;
    points.convertTo(points_f, CV_32F);

    mesh.clear();
    mesh.reserve(static_cast<size_t>(points_f.rows));
    for (int i = 0; i < points_f.rows; ++i) {
        const float* row = points_f.ptr<float>(i);
        mesh.push_back({row[0], row[1], row[2]});
    }
    return true;
}

/**
 * @brief 계산된 크롭을 이미지에 적용
 *
 * 배율로 리샘플한 뒤 크롭 사각형을 잘라낸다. 사각형이 이미지 밖으로
 * 나가는 부분은 흰색으로 채운다.
 */
cv::Mat applyCrop(const cv::Mat& image, const CropResult& result) {
    cv::Mat scaled;
    const int interpolation = result.scale_factor < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(image, scaled, cv::Size(), result.scale_factor, result.scale_factor, interpolation);

    const cv::Rect crop(result.crop_left, result.crop_top,
                        result.crop_right - result.crop_left,
                        result.crop_bottom - result.crop_top);
    const cv::Rect inside = crop & cv::Rect(0, 0, scaled.cols, scaled.rows);

    cv::Mat output(crop.size(), scaled.type(), cv::Scalar::all(255));
    if (!inside.empty()) {
        scaled(inside).copyTo(output(inside - crop.tl()));
    }
    return output;
}

void printResult(const CropResult& result) {
    std::cout << "[CropDemo] scale_factor: " << result.scale_factor << "\n";
    std::cout << "[CropDemo] crop: top=" << result.crop_top << " bottom=" << result.crop_bottom
              << " left=" << result.crop_left << " right=" << result.crop_right << "\n";
    std::cout << "[CropDemo] method: " << result.positioning_method.toString() << "\n";
    std::cout << "[CropDemo] head: " << result.achieved_head_height_px << "px, eyes from bottom: "
              << result.achieved_eye_level_from_bottom_px << "px\n";
    std::cout << "[CropDemo] success: " << (result.positioning_success ? "yes" : "no")
              << " (" << toString(result.error_code) << ")\n";
    for (const auto& warning : result.warnings) {
        std::cout << "[Warning] " << warning << "\n";
    }
}

} // namespace idphoto_sdk


/**
 * @brief 메인 함수
 */
int main(int argc, char* argv[]) {
    using namespace idphoto_sdk;

    std::cout << "===================================\n";
    std::cout << "   IdPhotoSDK Crop Demo v" << get_version() << "\n";
    std::cout << "===================================\n\n";

    if (argc < 5) {
        std::cerr << "사용법: " << argv[0]
                  << " <image> <landmarks.yaml> <country> <document>"
                  << " [output.png] [mask.png] [specs.yaml]\n";
        return 1;
    }

    const std::string image_path = argv[1];
    const std::string landmarks_path = argv[2];
    const std::string country = argv[3];
    const std::string document = argv[4];
    const std::string output_path = argc > 5 ? argv[5] : "cropped.png";
    const std::string mask_path = argc > 6 ? argv[6] : "";
    const std::string specs_path = argc > 7 ? argv[7] : "";

    // 규격
    DocumentSpecCatalog catalog = DocumentSpecCatalog::builtin();
    if (!specs_path.empty()) {
        ErrorCode error = ErrorCode::Success;
        if (!catalog.loadFromFile(specs_path, &error)) {
            std::cerr << "[Error] 규격 파일 로드 실패 (" << toString(error) << "): " << specs_path << "\n";
            return 1;
        }
        std::cout << "[Main] 규격 파일: " << specs_path << "\n";
    }

    const PhysicalDocumentSpec* physical = catalog.find(country, document);
    if (!physical) {
        std::cerr << "[Error] 규격을 찾을 수 없습니다: " << country << " / " << document << "\n";
        std::cerr << "사용 가능한 규격:\n";
        for (const auto& spec : catalog.specs()) {
            std::cerr << "  " << spec.country_code << " / " << spec.document_name << "\n";
        }
        return 1;
    }
    const DocumentSpec spec = physical->toPixelSpec();
    std::cout << "[Main] 규격: " << physical->country_code << " " << physical->document_name
              << " (" << spec.photo_width_px << "x" << spec.photo_height_px << "px)\n";

    // 입력
    if (!fs::exists(image_path)) {
        std::cerr << "[Error] 이미지를 찾을 수 없습니다: " << image_path << "\n";
        return 1;
    }
    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "[Error] 이미지 로드 실패: " << image_path << "\n";
        return 1;
    }

    std::vector<FaceLandmark> mesh;
    if (!loadLandmarks(landmarks_path, mesh)) {
        return 1;
    }
    std::cout << "[Main] 랜드마크: " << mesh.size() << "개\n";

    cv::Mat mask;
    if (!mask_path.empty()) {
        mask = cv::imread(mask_path, cv::IMREAD_GRAYSCALE);
        if (mask.empty()) {
            std::cerr << "[Warning] 마스크 로드 실패, 랜드마크만 사용합니다: " << mask_path << "\n";
        }
    }

    // 계산
    CropEngine engine;
    engine.setTraceHook(makeStderrTraceHook(TraceLevel::Warning));
    const CropResult result = engine.compute(mesh, image.cols, image.rows, spec,
                                             mask.empty() ? nullptr : &mask);
    printResult(result);

    // 적용 및 저장
    const cv::Mat output = applyCrop(image, result);
    if (!cv::imwrite(output_path, output)) {
        std::cerr << "[Error] 결과 저장 실패: " << output_path << "\n";
        return 1;
    }
    std::cout << "[Main] 저장: " << output_path << "\n";

    return result.positioning_success ? 0 : 2;
}
