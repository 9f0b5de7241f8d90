/**
 * @file compliance_validator.cpp
 * @brief 규격 준수 검증 구현
 */

#include "idphoto_sdk/compliance_validator.h"

#include <algorithm>
#include <cstdio>
#include <string>

namespace idphoto_sdk {

namespace {
    constexpr const char* STAGE = "compliance_validator";

    template <typename... Args>
    std::string formatWarning(const char* fmt, Args... args) {
        char buf[256];
        std::snprintf(buf, sizeof(buf), fmt, args...);
        return buf;
    }
}

void validateCompliance(CropResult& result,
                        const ScaledFace& face,
                        const DocumentSpec& spec,
                        const TraceHook& hook) {
    detail::Tracer trace(hook, STAGE);

    const double photo_height = static_cast<double>(spec.photo_height_px);
    const double crop_top = static_cast<double>(result.crop_top);

    // 크롭 상단 기준 위치
    const double head_top_from_top = face.head_top_y - crop_top;
    const double chin_from_top = face.chin_bottom_y - crop_top;
    const double eye_from_top = face.eye_level_y - crop_top;
    const double eye_from_bottom = photo_height - eye_from_top;

    // 프레임 경계에서 잘린 부분을 제외한 머리 높이
    const double visible_top = std::clamp(head_top_from_top, 0.0, photo_height);
    const double visible_chin = std::clamp(chin_from_top, 0.0, photo_height);
    const double achieved_head = visible_chin - visible_top;

    result.achieved_head_height_px = achieved_head;
    result.achieved_eye_level_from_top_px = eye_from_top;
    result.achieved_eye_level_from_bottom_px = eye_from_bottom;
    result.achieved_head_top_from_crop_top_px = head_top_from_top;

    trace.info("head top %.1fpx, eyes %.1fpx (from bottom %.1fpx), chin %.1fpx, visible head %.1fpx",
               head_top_from_top, eye_from_top, eye_from_bottom, chin_from_top, achieved_head);

    bool success = true;

    // 머리 높이 (필수)
    if (achieved_head < spec.head_min_px || achieved_head > spec.head_max_px) {
        result.warnings.push_back(formatWarning(
            "Head height %.1fpx is outside the required range (%d-%dpx).",
            achieved_head, spec.head_min_px, spec.head_max_px));
        success = false;
    }

    // 눈높이 (권고)
    if (spec.hasEyeRange()) {
        const int eye_min = *spec.eye_min_from_bottom_px;
        const int eye_max = *spec.eye_max_from_bottom_px;
        if (eye_from_bottom < eye_min || eye_from_bottom > eye_max) {
            result.warnings.push_back(formatWarning(
                "Eye line %.1fpx from bottom is outside the required range (%d-%dpx).",
                eye_from_bottom, eye_min, eye_max));
        }
    }

    // 머리 상단 거리 (권고)
    if (spec.hasHeadTopDistance()) {
        const int dist_min = *spec.head_top_min_dist_px;
        const int dist_max = *spec.head_top_max_dist_px;
        if (head_top_from_top < dist_min || head_top_from_top > dist_max) {
            result.warnings.push_back(formatWarning(
                "Head top %.1fpx from photo top is outside the required range (%d-%dpx).",
                head_top_from_top, dist_min, dist_max));
        }
    }

    // 프레임 잘림 (권고, 잘림은 이미 achieved_head 에 반영됨)
    if (head_top_from_top < 0.0) {
        result.warnings.push_back(formatWarning(
            "Head top is cut off by %.1fpx at the top edge.", -head_top_from_top));
    }
    if (chin_from_top > photo_height) {
        result.warnings.push_back(formatWarning(
            "Chin is cut off by %.1fpx at the bottom edge.", chin_from_top - photo_height));
    }

    result.positioning_success = success;

    for (const auto& warning : result.warnings) {
        trace.warning("%s", warning.c_str());
    }
    if (success) {
        trace.info("positioning succeeded");
    } else {
        trace.error("positioning failed: head height not compliant");
    }
}

} // namespace idphoto_sdk
