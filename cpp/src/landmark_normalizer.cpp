/**
 * @file landmark_normalizer.cpp
 * @brief NormalizedLandmarks 구현
 *
 * 인덱스 테이블 적용, 윤곽 극값 파생, 필수 영역 폴백.
 */

#include "idphoto_sdk/landmark_normalizer.h"

#include <algorithm>
#include <numeric>
#include <utility>

namespace idphoto_sdk {

namespace {
    const std::vector<PixelPoint> EMPTY_POINTS;

    constexpr const char* STAGE = "landmark_normalizer";

    struct EyeSide {
        const char* name;
        FaceRegion center;
        FaceRegion inner;
        FaceRegion outer;
    };

    constexpr EyeSide EYE_SIDES[] = {
        {"left", FaceRegion::LeftEyeCenter, FaceRegion::LeftEyeInner, FaceRegion::LeftEyeOuter},
        {"right", FaceRegion::RightEyeCenter, FaceRegion::RightEyeInner, FaceRegion::RightEyeOuter},
    };
}

const char* regionName(FaceRegion region) {
    switch (region) {
        case FaceRegion::FaceContourTop: return "face_contour_top";
        case FaceRegion::FaceContourBottom: return "face_contour_bottom";
        default: break;
    }
    for (const auto& entry : FACE_REGION_TABLE) {
        if (entry.region == region) {
            return entry.name;
        }
    }
    return "unknown";
}

// ============================================================
// 생성
// ============================================================

NormalizedLandmarks NormalizedLandmarks::fromMesh(const std::vector<FaceLandmark>& mesh,
                                                  int image_width,
                                                  int image_height,
                                                  const TraceHook& hook) {
    detail::Tracer trace(hook, STAGE);

    if (image_width <= 0 || image_height <= 0) {
        throw AnalysisError(ErrorCode::InvalidParameter,
                            "Image width and height must be positive.");
    }
    if (mesh.empty()) {
        throw AnalysisError(ErrorCode::InvalidParameter, "Landmark set is empty.");
    }

    NormalizedLandmarks result(image_width, image_height);
    const int max_index = static_cast<int>(mesh.size()) - 1;
    const double w = static_cast<double>(image_width);
    const double h = static_cast<double>(image_height);

    // 1. 인덱스 테이블 적용
    for (const auto& entry : FACE_REGION_TABLE) {
        auto& points = result.slot(entry.region);
        for (size_t i = 0; i < entry.count; ++i) {
            const int idx = entry.indices[i];
            if (idx < 0 || idx > max_index) {
                trace.debug("index %d for region %s out of bounds (%d), skipped",
                            idx, entry.name, max_index);
                continue;
            }
            const FaceLandmark& lm = mesh[static_cast<size_t>(idx)];
            points.push_back({static_cast<double>(lm.x) * w, static_cast<double>(lm.y) * h});
        }
    }

    // 2. 윤곽 극값 파생 (동일 y는 먼저 나온 점 유지)
    const auto& contour = result.points(FaceRegion::FaceContour);
    if (!contour.empty()) {
        auto by_y = [](const PixelPoint& a, const PixelPoint& b) { return a.y < b.y; };
        auto top = std::min_element(contour.begin(), contour.end(), by_y);
        auto bottom = std::max_element(contour.begin(), contour.end(), by_y);
        result.slot(FaceRegion::FaceContourTop) = {*top};
        result.slot(FaceRegion::FaceContourBottom) = {*bottom};
    } else {
        trace.warning("face contour missing, top/bottom fallbacks unavailable");
    }

    // 3. 필수 영역 폴백
    const std::pair<FaceRegion, FaceRegion> essential_fallbacks[] = {
        {FaceRegion::ForeheadTop, FaceRegion::FaceContourTop},
        {FaceRegion::ChinBottom, FaceRegion::FaceContourBottom},
    };
    for (const auto& [region, fallback] : essential_fallbacks) {
        if (!result.has(region) && result.has(fallback)) {
            result.slot(region) = result.points(fallback);
            trace.warning("fallback: used '%s' for '%s'", regionName(fallback), regionName(region));
        }
    }

    if (!result.has(FaceRegion::ForeheadTop)) {
        trace.error("forehead_top unresolved after fallbacks (%zu regions available)",
                    result.resolvedRegionCount());
        throw AnalysisError(ErrorCode::EssentialLandmarkMissing,
                            "Essential 'forehead_top' cannot be determined.");
    }
    if (!result.has(FaceRegion::ChinBottom)) {
        trace.error("chin_bottom unresolved after fallbacks (%zu regions available)",
                    result.resolvedRegionCount());
        throw AnalysisError(ErrorCode::EssentialLandmarkMissing,
                            "Essential 'chin_bottom' cannot be determined.");
    }

    // 4. 눈 중심 폴백 (inner/outer 중점)
    for (const auto& side : EYE_SIDES) {
        if (result.has(side.center)) {
            continue;
        }
        if (result.has(side.inner) && result.has(side.outer)) {
            const PixelPoint& p_in = result.points(side.inner).front();
            const PixelPoint& p_out = result.points(side.outer).front();
            result.slot(side.center) = {{(p_in.x + p_out.x) / 2.0, (p_in.y + p_out.y) / 2.0}};
            trace.warning("fallback: used inner/outer midpoint for %s eye center", side.name);
        } else {
            trace.warning("%s eye center unresolved", side.name);
        }
    }

    trace.debug("normalized %zu landmark regions from %zu points",
                result.resolvedRegionCount(), mesh.size());
    return result;
}

// ============================================================
// 조회
// ============================================================

bool NormalizedLandmarks::has(FaceRegion region) const noexcept {
    return !points(region).empty();
}

const std::vector<PixelPoint>& NormalizedLandmarks::points(FaceRegion region) const noexcept {
    const auto idx = static_cast<size_t>(region);
    if (idx >= regions_.size()) {
        return EMPTY_POINTS;
    }
    return regions_[idx];
}

double NormalizedLandmarks::minY(FaceRegion region) const {
    const auto& pts = points(region);
    double value = pts.front().y;
    for (const auto& pt : pts) {
        value = std::min(value, pt.y);
    }
    return value;
}

double NormalizedLandmarks::maxY(FaceRegion region) const {
    const auto& pts = points(region);
    double value = pts.front().y;
    for (const auto& pt : pts) {
        value = std::max(value, pt.y);
    }
    return value;
}

double NormalizedLandmarks::meanY(FaceRegion region) const {
    const auto& pts = points(region);
    double sum = std::accumulate(pts.begin(), pts.end(), 0.0,
                                 [](double acc, const PixelPoint& pt) { return acc + pt.y; });
    return sum / static_cast<double>(pts.size());
}

size_t NormalizedLandmarks::resolvedRegionCount() const noexcept {
    return static_cast<size_t>(std::count_if(regions_.begin(), regions_.end(),
                                             [](const std::vector<PixelPoint>& pts) {
                                                 return !pts.empty();
                                             }));
}

} // namespace idphoto_sdk
