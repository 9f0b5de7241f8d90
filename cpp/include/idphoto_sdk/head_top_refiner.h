/**
 * @file head_top_refiner.h
 * @brief 분할 마스크를 이용한 머리 상단 보정
 */

#pragma once

#include "idphoto_sdk/export.h"
#include "idphoto_sdk/landmark_normalizer.h"
#include "idphoto_sdk/trace.h"

// OpenCV 전방 선언 (헤더 의존성 분리)
namespace cv { class Mat; }

namespace idphoto_sdk {

/**
 * @brief 머리카락을 포함하도록 머리 상단 y를 보정
 *
 * 얼굴 좌우로 너비의 15%만큼 넓힌 가로 구간과, 이미지 상단부터
 * 랜드마크 이마 상단 + 이미지 높이의 5%까지의 세로 구간에서
 * 전경(값 > 0) 픽셀이 있는 가장 위 행을 찾는다.
 * 결과는 min(랜드마크 이마 상단, 마스크 최상단 행)이므로 머리 상단은
 * 위로만 이동한다.
 *
 * 마스크가 없거나 비어 있거나 구간 안에 전경이 없으면 랜드마크 값을
 * 그대로 반환한다. 예외를 던지지 않는다.
 *
 * @param landmarks 정규화된 영역 집합
 * @param mask 단일 채널 분할 마스크 (nullptr 허용, 다채널이면 0번 채널 사용)
 * @param hook 트레이스 훅
 * @return 보정된 머리 상단 y (원본 이미지 픽셀)
 */
IDPHOTO_SDK_EXPORT double refineHeadTop(const NormalizedLandmarks& landmarks,
                                        const cv::Mat* mask,
                                        const TraceHook& hook = TraceHook());

} // namespace idphoto_sdk
