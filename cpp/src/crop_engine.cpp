/**
 * @file crop_engine.cpp
 * @brief CropEngine 구현 - 파이프라인 조립 및 폴백 처리
 */

#include "idphoto_sdk/crop_engine.h"

#include "idphoto_sdk/compliance_validator.h"
#include "idphoto_sdk/crop_planner.h"
#include "idphoto_sdk/face_dimension_analyzer.h"
#include "idphoto_sdk/head_top_refiner.h"
#include "idphoto_sdk/landmark_normalizer.h"

#include <utility>

#include <opencv2/core.hpp>

namespace idphoto_sdk {

namespace {
    constexpr const char* STAGE = "crop_engine";
}

void CropEngine::setTraceHook(TraceHook hook) {
    trace_hook_ = std::move(hook);
}

CropResult CropEngine::makeFallbackResult(const DocumentSpec& spec,
                                          ErrorCode code,
                                          const std::string& reason) {
    CropResult result;
    result.scale_factor = 1.0;
    result.crop_top = 0;
    result.crop_left = 0;
    result.crop_bottom = spec.photo_height_px;
    result.crop_right = spec.photo_width_px;
    result.final_photo_width_px = spec.photo_width_px;
    result.final_photo_height_px = spec.photo_height_px;
    result.positioning_success = false;
    result.error_code = code;
    result.warnings.push_back("Face analysis error: " + reason);
    return result;
}

CropResult CropEngine::compute(const std::vector<FaceLandmark>& mesh,
                               int image_width,
                               int image_height,
                               const DocumentSpec& spec,
                               const cv::Mat* mask) const {
    detail::Tracer trace(trace_hook_, STAGE);
    trace.info("start: image %dx%d, target %dx%d, mask %s",
               image_width, image_height, spec.photo_width_px, spec.photo_height_px,
               (mask != nullptr && !mask->empty()) ? "provided" : "none");

    std::string spec_problem;
    if (!spec.isValid(&spec_problem)) {
        trace.error("invalid document spec: %s", spec_problem.c_str());
        return makeFallbackResult(spec, ErrorCode::InvalidDocumentSpec, spec_problem);
    }

    FaceDimensions dims;
    try {
        const NormalizedLandmarks landmarks =
            NormalizedLandmarks::fromMesh(mesh, image_width, image_height, trace_hook_);
        const double head_top_y = refineHeadTop(landmarks, mask, trace_hook_);
        dims = analyzeFaceDimensions(landmarks, head_top_y, trace_hook_);
    } catch (const AnalysisError& e) {
        trace.error("analysis failed (%s): %s", toString(e.code()), e.what());
        return makeFallbackResult(spec, e.code(), e.what());
    } catch (const cv::Exception& e) {
        trace.error("mask processing failed: %s", e.what());
        return makeFallbackResult(spec, ErrorCode::Unknown, e.what());
    }

    const double scale = selectScale(dims.head_height_px, spec, trace_hook_);
    const ScaledFace face = scaleFace(dims, scale);

    CropPlacement placement = selectPosition(face, spec, trace_hook_);
    correctMargins(placement, face, spec, trace_hook_);

    CropResult result;
    result.scale_factor = scale;
    result.final_photo_width_px = spec.photo_width_px;
    result.final_photo_height_px = spec.photo_height_px;
    result.positioning_method = placement.method;

    const CropRect rect = clampToImage(placement, image_width, image_height, scale, spec,
                                       &result.warnings, trace_hook_);
    result.crop_top = rect.top;
    result.crop_bottom = rect.bottom;
    result.crop_left = rect.left;
    result.crop_right = rect.right;

    validateCompliance(result, face, spec, trace_hook_);

    trace.info("done: scale=%.4f crop=[top %d, bottom %d, left %d, right %d] method=%s success=%s",
               result.scale_factor, result.crop_top, result.crop_bottom,
               result.crop_left, result.crop_right,
               result.positioning_method.toString().c_str(),
               result.positioning_success ? "true" : "false");
    return result;
}

} // namespace idphoto_sdk
