/**
 * @file crop_engine.h
 * @brief 문서 규격 크롭 엔진 선언
 *
 * 랜드마크, 선택적 분할 마스크, 문서 규격을 받아 배율과 크롭 사각형을
 * 계산하고 규격 준수 여부를 검증하는 단일 진입점.
 */

#pragma once

#include <string>
#include <vector>

#include "idphoto_sdk/document_spec.h"
#include "idphoto_sdk/export.h"
#include "idphoto_sdk/trace.h"
#include "idphoto_sdk/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace idphoto_sdk {

/**
 * @brief 문서 규격 크롭 엔진
 *
 * Normalize -> Refine -> Analyze -> Scale -> Position -> CorrectMargins
 * -> Clamp -> Validate 순서의 단방향 파이프라인.
 *
 * 분석 실패(필수 랜드마크 누락, 머리 높이 이상)나 잘못된 규격은
 * 예외 대신 전체 프레임 폴백 결과(scale_factor = 1.0,
 * positioning_success = false)로 변환된다.
 *
 * @note compute()는 const 이며 호출 간 상태를 공유하지 않음.
 *       트레이스 훅을 설정한 뒤에는 여러 스레드에서 동시에 호출 가능.
 *
 * 사용 예시:
 * @code
 * CropEngine engine;
 * engine.setTraceHook(makeStderrTraceHook(TraceLevel::Warning));
 *
 * DocumentSpec spec = DocumentSpecCatalog::builtin().find("US", "Passport")->toPixelSpec();
 * CropResult result = engine.compute(mesh, width, height, spec, &mask);
 *
 * if (result.positioning_success) {
 *     // result.scale_factor 로 리샘플 후 crop_* 영역 잘라내기
 * }
 * @endcode
 */
class IDPHOTO_SDK_EXPORT CropEngine {
public:
    CropEngine() = default;
    ~CropEngine() = default;

    CropEngine(const CropEngine&) = default;
    CropEngine& operator=(const CropEngine&) = default;
    CropEngine(CropEngine&&) = default;
    CropEngine& operator=(CropEngine&&) = default;

    // ========================================
    // 설정
    // ========================================

    /**
     * @brief 트레이스 훅 설정
     * @param hook 이벤트 수신 함수 (빈 함수면 트레이스 비활성화)
     */
    void setTraceHook(TraceHook hook);

    const TraceHook& traceHook() const noexcept { return trace_hook_; }

    // ========================================
    // 계산
    // ========================================

    /**
     * @brief 크롭 계산
     *
     * @param mesh 정규화 Face Mesh 랜드마크
     * @param image_width 원본 이미지 너비
     * @param image_height 원본 이미지 높이
     * @param spec 픽셀 단위 문서 규격
     * @param mask 분할 마스크 (nullptr 이면 랜드마크만 사용)
     * @return 크롭 결과 (항상 규격 크기의 사각형을 포함)
     */
    CropResult compute(const std::vector<FaceLandmark>& mesh,
                       int image_width,
                       int image_height,
                       const DocumentSpec& spec,
                       const cv::Mat* mask = nullptr) const;

    /**
     * @brief 전체 프레임 폴백 결과 생성
     *
     * @param spec 문서 규격 (사각형 크기 결정)
     * @param code 실패 원인
     * @param reason 경고에 포함할 설명
     */
    static CropResult makeFallbackResult(const DocumentSpec& spec,
                                         ErrorCode code,
                                         const std::string& reason);

private:
    TraceHook trace_hook_;
};

} // namespace idphoto_sdk
