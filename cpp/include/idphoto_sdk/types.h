/**
 * @file types.h
 * @brief IdPhotoSDK 핵심 데이터 타입 정의
 *
 * 크롭 엔진의 입력(랜드마크), 중간 결과(얼굴 치수), 출력(CropResult)에
 * 사용되는 기본 데이터 구조체 정의.
 */

#ifndef IDPHOTO_SDK_TYPES_H
#define IDPHOTO_SDK_TYPES_H

#include <string>
#include <vector>

#include "idphoto_sdk/export.h"

namespace idphoto_sdk {

// ============================================================
// 열거형 정의
// ============================================================

/**
 * @brief 에러 코드 열거형
 * SDK 작업 결과 상태
 */
enum class ErrorCode : int {
    // 성공
    Success = 0,

    // 200번대: 파라미터 에러
    InvalidParameter = 200,         ///< 잘못된 파라미터 (이미지 크기, 빈 랜드마크)
    InvalidDocumentSpec = 201,      ///< 문서 규격 값이 유효하지 않음

    // 300번대: 얼굴 분석 에러
    EssentialLandmarkMissing = 300, ///< 이마 상단/턱 하단 랜드마크 결정 불가
    InvalidHeadHeight = 301,        ///< 머리 높이가 1px 이하

    // 500번대: 설정 에러
    SpecFileOpenFailed = 500,       ///< 규격 파일 열기 실패
    SpecFileMalformed = 501,        ///< 규격 파일 형식 오류

    // 일반 에러
    Unknown = 999                   ///< 알 수 없는 에러
};

/**
 * @brief 세로 크롭 위치 결정 규칙
 * 우선순위 순서: HeadTopDistance > EyeFromBottom > DefaultMargin
 */
enum class PositioningRule : int {
    NotSet = 0,             ///< 결정되지 않음 (폴백 결과)
    HeadTopDistance = 1,    ///< 머리 상단 ~ 사진 상단 거리 규격
    EyeFromBottom = 2,      ///< 눈높이 ~ 사진 하단 거리 규격
    DefaultMargin = 3       ///< 기본 상단 여백 비율
};

/**
 * @brief 여백 보정 종류
 */
enum class MarginCorrection : int {
    HeadMarginFix = 0,      ///< 머리 위 최소 여백 보정
    ChinMarginFix = 1       ///< 턱 아래 최소 여백 보정
};

// ============================================================
// 기본 데이터 구조체
// ============================================================

/**
 * @brief 얼굴 랜드마크 좌표
 * 정규화된 좌표 (0.0~1.0). 범위를 벗어난 값도 허용.
 * POD 타입
 */
struct FaceLandmark {
    float x;    ///< X 좌표 (정규화)
    float y;    ///< Y 좌표 (정규화)
    float z;    ///< Z 좌표 (깊이, 정규화)
};

/**
 * @brief 픽셀 공간 좌표
 */
struct PixelPoint {
    double x;
    double y;
};

/**
 * @brief 원본 이미지 픽셀 공간에서의 얼굴 치수
 * 분석 단계에서 한 번 생성되고 이후 변경되지 않음.
 */
struct FaceDimensions {
    double head_top_y = 0.0;        ///< 머리 상단 (머리카락 포함)
    double chin_bottom_y = 0.0;     ///< 턱 하단
    double eye_level_y = 0.0;       ///< 눈높이
    double face_center_x = 0.0;     ///< 얼굴 중심 X
    double head_height_px = 0.0;    ///< 머리 높이 (chin_bottom_y - head_top_y)
    double face_width_px = 0.0;     ///< 얼굴 너비
};

/**
 * @brief 세로 위치 결정 방법과 적용된 보정 목록
 */
struct IDPHOTO_SDK_EXPORT PositioningMethod {
    PositioningRule rule = PositioningRule::NotSet;
    double parameter_px = 0.0;                  ///< 규칙이 사용한 목표값 (픽셀)
    std::vector<MarginCorrection> corrections;  ///< 적용 순서대로 기록

    bool hasCorrection(MarginCorrection correction) const;

    /**
     * @brief 사람이 읽을 수 있는 형태로 변환
     * @return 예: "EyeFromBottom (310.0px) +HeadMarginFix"
     */
    std::string toString() const;
};

/**
 * @brief 크롭 계산 결과
 *
 * 모든 좌표는 scale_factor가 적용된 이미지 공간 기준.
 * crop_right - crop_left == final_photo_width_px,
 * crop_bottom - crop_top == final_photo_height_px 는 폴백 경로에서도 항상 성립.
 */
struct IDPHOTO_SDK_EXPORT CropResult {
    double scale_factor = 1.0;

    int crop_top = 0;
    int crop_bottom = 0;
    int crop_left = 0;
    int crop_right = 0;

    int final_photo_width_px = 0;
    int final_photo_height_px = 0;

    // 달성된 측정값 (최종 사진 기준, 픽셀)
    double achieved_head_height_px = 0.0;
    double achieved_eye_level_from_top_px = 0.0;
    double achieved_eye_level_from_bottom_px = 0.0;
    double achieved_head_top_from_crop_top_px = 0.0;

    PositioningMethod positioning_method;
    bool positioning_success = false;
    std::vector<std::string> warnings;

    ErrorCode error_code = ErrorCode::Success;
};

// ============================================================
// 문자열 변환 유틸리티
// ============================================================

IDPHOTO_SDK_EXPORT const char* toString(ErrorCode code);
IDPHOTO_SDK_EXPORT const char* toString(PositioningRule rule);
IDPHOTO_SDK_EXPORT const char* toString(MarginCorrection correction);

} // namespace idphoto_sdk

#endif // IDPHOTO_SDK_TYPES_H
