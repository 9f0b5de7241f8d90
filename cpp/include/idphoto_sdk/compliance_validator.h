/**
 * @file compliance_validator.h
 * @brief 최종 크롭의 규격 준수 검증
 */

#pragma once

#include "idphoto_sdk/crop_planner.h"
#include "idphoto_sdk/document_spec.h"
#include "idphoto_sdk/export.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/types.h"

namespace idphoto_sdk {

/**
 * @brief 달성 측정값 계산 및 준수 여부 판정
 *
 * 머리 높이 범위 위반만 positioning_success 를 false로 만든다.
 * 눈높이, 머리 상단 거리, 프레임 잘림은 경고만 추가한다.
 *
 * @param result 입출력. scale_factor, crop_*, positioning_method, warnings 가
 *        채워진 상태로 전달되며 achieved_* 와 positioning_success 가 기록됨.
 */
IDPHOTO_SDK_EXPORT void validateCompliance(CropResult& result,
                                           const ScaledFace& face,
                                           const DocumentSpec& spec,
                                           const TraceHook& hook = TraceHook());

} // namespace idphoto_sdk
