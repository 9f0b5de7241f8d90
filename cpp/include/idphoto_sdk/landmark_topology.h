/**
 * @file landmark_topology.h
 * @brief MediaPipe Face Mesh 랜드마크 인덱스 테이블
 *
 * 영역 이름 -> 랜드마크 인덱스 매핑. 외부 랜드마크 검출기의
 * 토폴로지에 대한 계약이므로 검출 모델 변경 시 함께 갱신해야 함.
 */

#pragma once

#include <cstddef>
#include <iterator>

#include "idphoto_sdk/export.h"

namespace idphoto_sdk {

/// Face Mesh 기본 랜드마크 개수 (홍채 제외)
constexpr int FACE_MESH_LANDMARK_COUNT = 468;

/// 홍채 정제(refine_landmarks) 포함 랜드마크 개수
constexpr int FACE_MESH_WITH_IRIS_LANDMARK_COUNT = 478;

/**
 * @brief 얼굴 영역 열거형
 *
 * FaceContourTop / FaceContourBottom 은 테이블에 없는 파생 영역으로,
 * FaceContour 의 y 극값에서 계산됨.
 */
enum class FaceRegion : int {
    ForeheadTop = 0,
    TempleLeft,
    TempleRight,
    LeftEyeCenter,
    LeftEyeInner,
    LeftEyeOuter,
    RightEyeCenter,
    RightEyeInner,
    RightEyeOuter,
    ChinBottom,
    FaceContour,

    // 파생 영역
    FaceContourTop,
    FaceContourBottom,

    Count
};

constexpr size_t FACE_REGION_COUNT = static_cast<size_t>(FaceRegion::Count);

namespace topology {

constexpr int FOREHEAD_TOP[] = {10};
constexpr int TEMPLE_LEFT[] = {234, 127, 162};
constexpr int TEMPLE_RIGHT[] = {454, 356, 389};

// 눈 중심 (홍채 중심 + 홍채 경계점)
constexpr int LEFT_EYE_CENTER[] = {468, 470};
constexpr int LEFT_EYE_INNER[] = {133};
constexpr int LEFT_EYE_OUTER[] = {33};
constexpr int RIGHT_EYE_CENTER[] = {473, 475};
constexpr int RIGHT_EYE_INNER[] = {362};
constexpr int RIGHT_EYE_OUTER[] = {263};

constexpr int CHIN_BOTTOM[] = {152};

// 얼굴 윤곽 (10번 이마에서 시작해 시계 방향, 18번째가 152번 턱)
constexpr int FACE_CONTOUR[] = {
    10, 338, 297, 332, 284, 251, 389, 356, 454, 323, 361, 288,
    397, 365, 379, 378, 400, 377, 152, 148, 176, 149, 150, 136,
    172, 58, 132, 93, 234, 127, 162, 21, 54, 103, 67, 109
};

} // namespace topology

/**
 * @brief 영역별 인덱스 목록
 */
struct RegionIndices {
    FaceRegion region;
    const char* name;
    const int* indices;
    size_t count;
};

/**
 * @brief 영역 테이블 (파생 영역 제외, FaceRegion 순서)
 */
constexpr RegionIndices FACE_REGION_TABLE[] = {
    {FaceRegion::ForeheadTop, "forehead_top", topology::FOREHEAD_TOP, std::size(topology::FOREHEAD_TOP)},
    {FaceRegion::TempleLeft, "temple_left", topology::TEMPLE_LEFT, std::size(topology::TEMPLE_LEFT)},
    {FaceRegion::TempleRight, "temple_right", topology::TEMPLE_RIGHT, std::size(topology::TEMPLE_RIGHT)},
    {FaceRegion::LeftEyeCenter, "left_eye_center", topology::LEFT_EYE_CENTER, std::size(topology::LEFT_EYE_CENTER)},
    {FaceRegion::LeftEyeInner, "left_eye_inner", topology::LEFT_EYE_INNER, std::size(topology::LEFT_EYE_INNER)},
    {FaceRegion::LeftEyeOuter, "left_eye_outer", topology::LEFT_EYE_OUTER, std::size(topology::LEFT_EYE_OUTER)},
    {FaceRegion::RightEyeCenter, "right_eye_center", topology::RIGHT_EYE_CENTER, std::size(topology::RIGHT_EYE_CENTER)},
    {FaceRegion::RightEyeInner, "right_eye_inner", topology::RIGHT_EYE_INNER, std::size(topology::RIGHT_EYE_INNER)},
    {FaceRegion::RightEyeOuter, "right_eye_outer", topology::RIGHT_EYE_OUTER, std::size(topology::RIGHT_EYE_OUTER)},
    {FaceRegion::ChinBottom, "chin_bottom", topology::CHIN_BOTTOM, std::size(topology::CHIN_BOTTOM)},
    {FaceRegion::FaceContour, "face_contour", topology::FACE_CONTOUR, std::size(topology::FACE_CONTOUR)},
};

static_assert(std::size(FACE_REGION_TABLE) == static_cast<size_t>(FaceRegion::FaceContourTop),
              "FACE_REGION_TABLE must cover every non-derived FaceRegion");

/**
 * @brief 영역 이름 반환 (로그 출력용)
 */
IDPHOTO_SDK_EXPORT const char* regionName(FaceRegion region);

} // namespace idphoto_sdk
