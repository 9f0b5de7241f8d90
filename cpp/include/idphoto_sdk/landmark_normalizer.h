/**
 * @file landmark_normalizer.h
 * @brief 정규화 랜드마크 -> 픽셀 공간 영역 변환
 */

#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

#include "idphoto_sdk/export.h"
#include "idphoto_sdk/landmark_topology.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/types.h"

namespace idphoto_sdk {

/**
 * @brief 얼굴 분석 실패 예외
 *
 * 필수 랜드마크 결정 불가, 머리 높이 이상 등 입력 기하 자체를
 * 사용할 수 없는 경우에만 발생. CropEngine::compute() 밖으로는
 * 전파되지 않음.
 */
class IDPHOTO_SDK_EXPORT AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief 픽셀 공간 영역별 랜드마크 집합 (LandmarkSet)
 *
 * 인덱스 테이블(landmark_topology.h)을 외부 메시에 적용한 결과.
 * 범위를 벗어난 인덱스는 건너뛰며, 점이 하나도 없는 영역은 존재하지 않음.
 *
 * 폴백 규칙:
 * - forehead_top 누락 -> face_contour_top
 * - chin_bottom 누락 -> face_contour_bottom
 * - 눈 center 누락 -> 같은 쪽 inner/outer 중점
 */
class IDPHOTO_SDK_EXPORT NormalizedLandmarks {
public:
    /**
     * @brief 메시에서 영역 집합 생성
     *
     * @param mesh 정규화 랜드마크 (Face Mesh 인덱스 순서)
     * @param image_width 원본 이미지 너비
     * @param image_height 원본 이미지 높이
     * @param hook 트레이스 훅 (비어 있어도 됨)
     * @throws AnalysisError 빈 메시/잘못된 이미지 크기(InvalidParameter),
     *         forehead_top 또는 chin_bottom 결정 불가(EssentialLandmarkMissing)
     */
    static NormalizedLandmarks fromMesh(const std::vector<FaceLandmark>& mesh,
                                        int image_width,
                                        int image_height,
                                        const TraceHook& hook = TraceHook());

    bool has(FaceRegion region) const noexcept;

    /**
     * @brief 영역의 점 목록 (없으면 빈 목록)
     */
    const std::vector<PixelPoint>& points(FaceRegion region) const noexcept;

    /// 영역 점들의 y 최소값. 영역이 없으면 호출하지 말 것.
    double minY(FaceRegion region) const;
    /// 영역 점들의 y 최대값
    double maxY(FaceRegion region) const;
    /// 영역 점들의 y 평균
    double meanY(FaceRegion region) const;

    int imageWidth() const noexcept { return image_width_; }
    int imageHeight() const noexcept { return image_height_; }

    /// 해결된 영역 수 (파생 영역 포함)
    size_t resolvedRegionCount() const noexcept;

private:
    NormalizedLandmarks(int image_width, int image_height)
        : image_width_(image_width), image_height_(image_height) {}

    std::vector<PixelPoint>& slot(FaceRegion region) {
        return regions_[static_cast<size_t>(region)];
    }

    std::array<std::vector<PixelPoint>, FACE_REGION_COUNT> regions_;
    int image_width_;
    int image_height_;
};

} // namespace idphoto_sdk
