/**
 * @file face_dimension_analyzer.h
 * @brief 얼굴 치수 계산
 */

#pragma once

#include "idphoto_sdk/export.h"
#include "idphoto_sdk/landmark_normalizer.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/types.h"

namespace idphoto_sdk {

/**
 * @brief 영역 집합과 보정된 머리 상단에서 얼굴 치수 계산
 *
 * - head_height_px = chin_bottom_y - head_top_y (1px 이하면 예외)
 * - eye_level_y = 좌/우 눈 중심 y 평균, 한쪽이라도 없으면
 *   머리 상단에서 머리 높이의 40% 아래로 추정
 * - face_center_x / face_width_px = 얼굴 윤곽 x 극값,
 *   윤곽이 없으면 이미지 중심 / 이미지 너비의 60%
 *
 * @throws AnalysisError head_height_px <= 1 (InvalidHeadHeight)
 */
IDPHOTO_SDK_EXPORT FaceDimensions analyzeFaceDimensions(const NormalizedLandmarks& landmarks,
                                                        double refined_head_top_y,
                                                        const TraceHook& hook = TraceHook());

} // namespace idphoto_sdk
