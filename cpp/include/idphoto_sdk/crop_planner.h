/**
 * @file crop_planner.h
 * @brief 배율 선택, 크롭 위치 선택, 여백 보정, 경계 클램핑
 *
 * CropEngine 파이프라인의 중간 단계들. 모든 좌표는 배율이 적용된
 * 이미지 공간 기준이며, 각 단계는 입력만 읽고 결과를 반환한다.
 */

#pragma once

#include <string>
#include <vector>

#include "idphoto_sdk/document_spec.h"
#include "idphoto_sdk/export.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/types.h"

namespace idphoto_sdk {

/// 배율 하한 (비정상 입력 보호)
constexpr double MIN_SCALE_FACTOR = 0.25;

/// 배율 상한
constexpr double MAX_SCALE_FACTOR = 3.0;

/**
 * @brief 배율이 적용된 얼굴 기준점
 */
struct ScaledFace {
    double scale_factor = 1.0;
    double head_top_y = 0.0;
    double chin_bottom_y = 0.0;
    double eye_level_y = 0.0;
    double face_center_x = 0.0;
};

/**
 * @brief 크롭 원점 (실수, 배율 적용 공간)
 */
struct CropPlacement {
    double crop_top = 0.0;
    double crop_left = 0.0;
    PositioningMethod method;
};

/**
 * @brief 정수 크롭 사각형
 */
struct CropRect {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;
};

// ============================================================
// ScaleSelector
// ============================================================

/**
 * @brief 머리 높이 범위 중앙값을 목표로 배율 선택
 *
 * 결과 머리 높이가 범위를 벗어나면 범위 경계로 다시 계산하고,
 * 최종적으로 [MIN_SCALE_FACTOR, MAX_SCALE_FACTOR]로 제한한다.
 *
 * @param head_height_px 원본 머리 높이 (> 1)
 */
IDPHOTO_SDK_EXPORT double selectScale(double head_height_px,
                                      const DocumentSpec& spec,
                                      const TraceHook& hook = TraceHook());

/**
 * @brief 얼굴 치수에 배율 적용
 */
IDPHOTO_SDK_EXPORT ScaledFace scaleFace(const FaceDimensions& dims, double scale_factor);

// ============================================================
// PositionSelector
// ============================================================

/**
 * @brief 크롭 원점 선택
 *
 * 세로: HeadTopDistance -> EyeFromBottom -> DefaultMargin 우선순위.
 * 앞 규칙의 min/max 가 모두 설정된 경우에만 그 규칙을 사용한다.
 * 가로: 얼굴 중심이 사진 중앙에 오도록 배치.
 */
IDPHOTO_SDK_EXPORT CropPlacement selectPosition(const ScaledFace& face,
                                                const DocumentSpec& spec,
                                                const TraceHook& hook = TraceHook());

// ============================================================
// MarginCorrector
// ============================================================

/**
 * @brief 머리 위 / 턱 아래 최소 여백 보정
 *
 * 머리 여백을 먼저, 턱 여백을 나중에 보정한다. 턱 보정이 머리 여백을
 * 다시 위반할 수 있으나 재검사하지 않는다 (두 제약이 동시에 만족될 수
 * 없는 경우의 우선순위는 제품 결정 사항).
 * crop_top 만 변경하며 적용된 보정은 placement.method 에 기록된다.
 */
IDPHOTO_SDK_EXPORT void correctMargins(CropPlacement& placement,
                                       const ScaledFace& face,
                                       const DocumentSpec& spec,
                                       const TraceHook& hook = TraceHook());

// ============================================================
// BoundaryClamper
// ============================================================

/**
 * @brief 크롭 원점을 배율 적용 이미지 안으로 제한하고 정수 사각형 생성
 *
 * 배율 적용 이미지가 목표 크기보다 작은 축은 원점을 0으로 두고
 * warnings 에 경고를 추가한다 (크롭이 이미지 밖으로 나감).
 * 크기는 항상 정확히 photo_width_px x photo_height_px.
 *
 * @param warnings 경고 출력 (nullptr 허용)
 */
IDPHOTO_SDK_EXPORT CropRect clampToImage(const CropPlacement& placement,
                                         int image_width,
                                         int image_height,
                                         double scale_factor,
                                         const DocumentSpec& spec,
                                         std::vector<std::string>* warnings,
                                         const TraceHook& hook = TraceHook());

} // namespace idphoto_sdk
