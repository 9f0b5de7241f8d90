/**
 * @file crop_planner.cpp
 * @brief 배율 선택, 위치 선택, 여백 보정, 경계 클램핑 구현
 */

#include "idphoto_sdk/crop_planner.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <opencv2/core.hpp>

namespace idphoto_sdk {

// ============================================================
// ScaleSelector
// ============================================================

double selectScale(double head_height_px, const DocumentSpec& spec, const TraceHook& hook) {
    detail::Tracer trace(hook, "scale_selector");

    const double head_min = static_cast<double>(spec.head_min_px);
    const double head_max = static_cast<double>(spec.head_max_px);
    const double ideal_head_px = (head_min + head_max) / 2.0;

    double scale = ideal_head_px / head_height_px;
    trace.info("scale for ideal head %.1fpx from original %.1fpx: %.4f",
               ideal_head_px, head_height_px, scale);

    const double scaled_head = head_height_px * scale;
    if (scaled_head < head_min) {
        scale = head_min / head_height_px;
        trace.info("adjusted scale to meet head_min_px (%d): %.4f", spec.head_min_px, scale);
    } else if (scaled_head > head_max) {
        scale = head_max / head_height_px;
        trace.info("adjusted scale to meet head_max_px (%d): %.4f", spec.head_max_px, scale);
    }

    if (scale < MIN_SCALE_FACTOR || scale > MAX_SCALE_FACTOR) {
        const double clamped = std::clamp(scale, MIN_SCALE_FACTOR, MAX_SCALE_FACTOR);
        trace.warning("scale %.4f outside [%.2f, %.2f], clamped to %.4f",
                      scale, MIN_SCALE_FACTOR, MAX_SCALE_FACTOR, clamped);
        scale = clamped;
    }
    return scale;
}

ScaledFace scaleFace(const FaceDimensions& dims, double scale_factor) {
    ScaledFace face;
    face.scale_factor = scale_factor;
    face.head_top_y = dims.head_top_y * scale_factor;
    face.chin_bottom_y = dims.chin_bottom_y * scale_factor;
    face.eye_level_y = dims.eye_level_y * scale_factor;
    face.face_center_x = dims.face_center_x * scale_factor;
    return face;
}

// ============================================================
// PositionSelector
// ============================================================

CropPlacement selectPosition(const ScaledFace& face, const DocumentSpec& spec, const TraceHook& hook) {
    detail::Tracer trace(hook, "position_selector");

    const double photo_width = static_cast<double>(spec.photo_width_px);
    const double photo_height = static_cast<double>(spec.photo_height_px);

    CropPlacement placement;

    if (spec.hasHeadTopDistance()) {
        const double target = (*spec.head_top_min_dist_px + *spec.head_top_max_dist_px) / 2.0;
        placement.crop_top = face.head_top_y - target;
        placement.method.rule = PositioningRule::HeadTopDistance;
        placement.method.parameter_px = target;
    } else if (spec.hasEyeRange()) {
        const double target_from_bottom = (*spec.eye_min_from_bottom_px + *spec.eye_max_from_bottom_px) / 2.0;
        const double target_from_top = photo_height - target_from_bottom;
        placement.crop_top = face.eye_level_y - target_from_top;
        placement.method.rule = PositioningRule::EyeFromBottom;
        placement.method.parameter_px = target_from_bottom;
    } else {
        const double margin = photo_height * spec.default_head_top_margin_percent;
        placement.crop_top = face.head_top_y - margin;
        placement.method.rule = PositioningRule::DefaultMargin;
        placement.method.parameter_px = margin;
    }

    placement.crop_left = face.face_center_x - photo_width / 2.0;

    trace.info("positioned by %s: crop_top=%.1f crop_left=%.1f",
               placement.method.toString().c_str(), placement.crop_top, placement.crop_left);
    return placement;
}

// ============================================================
// MarginCorrector
// ============================================================

void correctMargins(CropPlacement& placement,
                    const ScaledFace& face,
                    const DocumentSpec& spec,
                    const TraceHook& hook) {
    detail::Tracer trace(hook, "margin_corrector");

    const double photo_height = static_cast<double>(spec.photo_height_px);
    const double min_head = static_cast<double>(spec.min_visual_head_margin_px);
    const double min_chin = static_cast<double>(spec.min_visual_chin_margin_px);

    const double head_margin = face.head_top_y - placement.crop_top;
    if (head_margin < min_head) {
        const double shifted = placement.crop_top - (min_head - head_margin);
        trace.warning("head margin %.1fpx < %d, crop_top %.1f -> %.1f",
                      head_margin, spec.min_visual_head_margin_px, placement.crop_top, shifted);
        placement.crop_top = shifted;
        placement.method.corrections.push_back(MarginCorrection::HeadMarginFix);
    }

    // 머리 여백 보정 이후 값 기준, 재검사 없음
    const double chin_margin = (placement.crop_top + photo_height) - face.chin_bottom_y;
    if (chin_margin < min_chin) {
        const double shifted = placement.crop_top + (min_chin - chin_margin);
        trace.warning("chin margin %.1fpx < %d, crop_top %.1f -> %.1f",
                      chin_margin, spec.min_visual_chin_margin_px, placement.crop_top, shifted);
        placement.crop_top = shifted;
        placement.method.corrections.push_back(MarginCorrection::ChinMarginFix);
    }
}

// ============================================================
// BoundaryClamper
// ============================================================

namespace {

/**
 * @brief 정수 원점을 [0, scaled_extent - target] 로 제한. 상한이 음수면 0.
 */
int clampOrigin(int origin, int scaled_extent, int target_extent) {
    return std::max(0, std::min(origin, scaled_extent - target_extent));
}

} // namespace

CropRect clampToImage(const CropPlacement& placement,
                      int image_width,
                      int image_height,
                      double scale_factor,
                      const DocumentSpec& spec,
                      std::vector<std::string>* warnings,
                      const TraceHook& hook) {
    detail::Tracer trace(hook, "boundary_clamper");

    // cv::resize 와 같은 반올림 (0.5 는 짝수 쪽)
    const int scaled_width = cvRound(static_cast<double>(image_width) * scale_factor);
    const int scaled_height = cvRound(static_cast<double>(image_height) * scale_factor);

    // 반올림 후 클램핑
    const int top_rounded = static_cast<int>(std::lround(placement.crop_top));
    const int left_rounded = static_cast<int>(std::lround(placement.crop_left));

    CropRect rect;
    rect.top = clampOrigin(top_rounded, scaled_height, spec.photo_height_px);
    rect.left = clampOrigin(left_rounded, scaled_width, spec.photo_width_px);
    rect.bottom = rect.top + spec.photo_height_px;
    rect.right = rect.left + spec.photo_width_px;

    if (rect.top != top_rounded) {
        trace.warning("crop_top clamped %.1f -> %d (scaled height %d)",
                      placement.crop_top, rect.top, scaled_height);
    }
    if (rect.left != left_rounded) {
        trace.warning("crop_left clamped %.1f -> %d (scaled width %d)",
                      placement.crop_left, rect.left, scaled_width);
    }

    auto warnUndersized = [&](const char* axis, int scaled_extent, int target_extent) {
        if (scaled_extent >= target_extent) {
            return;
        }
        char message[200];
        std::snprintf(message, sizeof(message),
                      "Scaled image %s (%dpx) is smaller than the target photo (%dpx); "
                      "crop extends beyond available pixels.",
                      axis, scaled_extent, target_extent);
        trace.warning("%s", message);
        if (warnings) {
            warnings->emplace_back(message);
        }
    };
    warnUndersized("height", scaled_height, spec.photo_height_px);
    warnUndersized("width", scaled_width, spec.photo_width_px);

    return rect;
}

} // namespace idphoto_sdk
