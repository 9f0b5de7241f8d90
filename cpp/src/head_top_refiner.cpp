/**
 * @file head_top_refiner.cpp
 * @brief 분할 마스크 기반 머리 상단 보정 구현
 */

#include "idphoto_sdk/head_top_refiner.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <opencv2/core.hpp>

namespace idphoto_sdk {

namespace {
    constexpr const char* STAGE = "head_top_refiner";

    /// 가로 탐색 구간 여유 (얼굴 너비 대비)
    constexpr double SEARCH_PADDING_X_RATIO = 0.15;

    /// 세로 탐색 구간 확장 (이미지 높이 대비, 랜드마크 이마 상단 아래로)
    constexpr double SEARCH_EXTENSION_Y_RATIO = 0.05;

    /// 가로 탐색 구간을 정하는 영역 (관자놀이 + 얼굴 윤곽)
    constexpr FaceRegion SEARCH_REGIONS[] = {
        FaceRegion::TempleLeft,
        FaceRegion::TempleRight,
        FaceRegion::FaceContour,
    };

    /**
     * @brief 가로 탐색 구간 계산 [start, end)
     */
    void computeHorizontalWindow(const NormalizedLandmarks& landmarks,
                                 const detail::Tracer& trace,
                                 int& start, int& end) {
        const int image_width = landmarks.imageWidth();
        // 점이 없으면 [0, 0) 이 되어 아래 퇴화 구간 처리로 전체 너비 탐색
        double min_x = std::numeric_limits<double>::max();
        double max_x = std::numeric_limits<double>::lowest();
        for (FaceRegion region : SEARCH_REGIONS) {
            for (const auto& pt : landmarks.points(region)) {
                min_x = std::min(min_x, pt.x);
                max_x = std::max(max_x, pt.x);
            }
        }
        if (min_x > max_x) {
            min_x = max_x = 0.0;
        }

        const double padding = (max_x - min_x) * SEARCH_PADDING_X_RATIO;
        start = std::max(0, static_cast<int>(min_x - padding));
        end = std::min(image_width, static_cast<int>(max_x + padding));

        if (start >= end) {
            trace.warning("degenerate horizontal search window [%d, %d), widened to full width",
                          start, end);
            start = 0;
            end = image_width;
        }
    }
}

double refineHeadTop(const NormalizedLandmarks& landmarks,
                     const cv::Mat* mask,
                     const TraceHook& hook) {
    detail::Tracer trace(hook, STAGE);

    const double landmark_top_y = landmarks.minY(FaceRegion::ForeheadTop);

    if (mask == nullptr || mask->empty()) {
        trace.info("no segmentation mask, using landmark head top %.1fpx", landmark_top_y);
        return landmark_top_y;
    }

    const int image_width = landmarks.imageWidth();
    const int image_height = landmarks.imageHeight();

    if (mask->cols != image_width || mask->rows != image_height) {
        trace.warning("mask dimensions (%dx%d) differ from image (%dx%d), scanning overlap only",
                      mask->cols, mask->rows, image_width, image_height);
    }

    // 탐색 구간
    int x_start = 0;
    int x_end = image_width;
    computeHorizontalWindow(landmarks, trace, x_start, x_end);

    const int y_end = std::min(
        image_height,
        static_cast<int>(landmark_top_y + static_cast<double>(image_height) * SEARCH_EXTENSION_Y_RATIO));

    cv::Rect window = cv::Rect(x_start, 0, x_end - x_start, std::max(0, y_end))
                    & cv::Rect(0, 0, mask->cols, mask->rows);
    if (window.empty()) {
        trace.warning("search window outside mask, using landmark head top %.1fpx", landmark_top_y);
        return landmark_top_y;
    }

    // 전경 픽셀 (값 > 0)
    cv::Mat roi = (*mask)(window);
    if (roi.channels() > 1) {
        cv::Mat first_channel;
        cv::extractChannel(roi, first_channel, 0);
        roi = first_channel;
    }

    cv::Mat foreground;
    cv::compare(roi, cv::Scalar::all(0), foreground, cv::CMP_GT);

    std::vector<cv::Point> foreground_points;
    cv::findNonZero(foreground, foreground_points);

    if (foreground_points.empty()) {
        trace.warning("no foreground pixels in search window, using landmark head top %.1fpx",
                      landmark_top_y);
        return landmark_top_y;
    }

    const cv::Rect bounds = cv::boundingRect(foreground_points);
    const double mask_top_y = static_cast<double>(window.y + bounds.y);
    const double refined = std::min(landmark_top_y, mask_top_y);

    trace.info("mask head top %.1fpx, landmark head top %.1fpx -> %.1fpx",
               mask_top_y, landmark_top_y, refined);
    if (landmark_top_y - mask_top_y > 5.0) {
        trace.info("hair detected %.1fpx above landmark forehead", landmark_top_y - mask_top_y);
    }
    return refined;
}

} // namespace idphoto_sdk
