/**
 * @file face_dimension_analyzer.cpp
 * @brief 얼굴 치수 계산 구현
 */

#include "idphoto_sdk/face_dimension_analyzer.h"

#include <algorithm>
#include <cstdio>

namespace idphoto_sdk {

namespace {
    constexpr const char* STAGE = "face_dimension_analyzer";

    /// 머리 높이 최소값 (이하이면 분석 실패)
    constexpr double MIN_HEAD_HEIGHT_PX = 1.0;

    /// 눈 랜드마크가 없을 때 머리 상단에서 눈까지의 비율
    constexpr double EYE_LEVEL_FALLBACK_RATIO = 0.40;

    /// 윤곽이 없을 때 추정 얼굴 너비 (이미지 너비 대비)
    constexpr double FACE_WIDTH_FALLBACK_RATIO = 0.60;
}

FaceDimensions analyzeFaceDimensions(const NormalizedLandmarks& landmarks,
                                     double refined_head_top_y,
                                     const TraceHook& hook) {
    detail::Tracer trace(hook, STAGE);

    FaceDimensions dims;
    dims.head_top_y = refined_head_top_y;
    dims.chin_bottom_y = landmarks.maxY(FaceRegion::ChinBottom);
    dims.head_height_px = dims.chin_bottom_y - dims.head_top_y;

    if (dims.head_height_px <= MIN_HEAD_HEIGHT_PX) {
        char message[160];
        std::snprintf(message, sizeof(message),
                      "Invalid head height: %.2f (top: %.2f, chin: %.2f).",
                      dims.head_height_px, dims.head_top_y, dims.chin_bottom_y);
        trace.error("%s", message);
        throw AnalysisError(ErrorCode::InvalidHeadHeight, message);
    }

    // 눈높이
    if (landmarks.has(FaceRegion::LeftEyeCenter) && landmarks.has(FaceRegion::RightEyeCenter)) {
        const double left_y = landmarks.meanY(FaceRegion::LeftEyeCenter);
        const double right_y = landmarks.meanY(FaceRegion::RightEyeCenter);
        dims.eye_level_y = (left_y + right_y) / 2.0;
        trace.debug("eye level: left=%.1f right=%.1f mean=%.1f", left_y, right_y, dims.eye_level_y);
    } else {
        dims.eye_level_y = dims.head_top_y + dims.head_height_px * EYE_LEVEL_FALLBACK_RATIO;
        trace.warning("eye landmarks missing, estimated eye level %.1fpx (%.0f%% below head top)",
                      dims.eye_level_y, EYE_LEVEL_FALLBACK_RATIO * 100.0);
    }

    // 얼굴 중심 / 너비
    const auto& contour = landmarks.points(FaceRegion::FaceContour);
    if (!contour.empty()) {
        auto by_x = [](const PixelPoint& a, const PixelPoint& b) { return a.x < b.x; };
        const auto [min_it, max_it] = std::minmax_element(contour.begin(), contour.end(), by_x);
        dims.face_center_x = (min_it->x + max_it->x) / 2.0;
        dims.face_width_px = max_it->x - min_it->x;
    } else {
        const double image_width = static_cast<double>(landmarks.imageWidth());
        dims.face_center_x = image_width / 2.0;
        dims.face_width_px = image_width * FACE_WIDTH_FALLBACK_RATIO;
        trace.warning("face contour missing, using image center and %.0f%% width estimate",
                      FACE_WIDTH_FALLBACK_RATIO * 100.0);
    }

    trace.info("head=%.1fpx width=%.1fpx top=%.1f eyes=%.1f chin=%.1f center_x=%.1f",
               dims.head_height_px, dims.face_width_px, dims.head_top_y,
               dims.eye_level_y, dims.chin_bottom_y, dims.face_center_x);
    return dims;
}

} // namespace idphoto_sdk
