/**
 * @file test_head_top_refiner.cpp
 * @brief 분할 마스크 기반 머리 상단 보정 테스트
 */

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "idphoto_sdk/head_top_refiner.h"
#include "synthetic_face.h"

namespace idphoto_sdk {
namespace testing {

class HeadTopRefinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mesh_ = makeFaceMesh(face_);
    }

    NormalizedLandmarks landmarks() const {
        return NormalizedLandmarks::fromMesh(mesh_, face_.image_width, face_.image_height);
    }

    cv::Mat emptyMask() const {
        return cv::Mat::zeros(face_.image_height, face_.image_width, CV_8UC1);
    }

    static bool hasEvent(const std::vector<TraceEvent>& events, TraceLevel level, const char* text) {
        for (const auto& e : events) {
            if (e.level == level && e.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    // 얼굴 윤곽 x 범위: [350, 650], 탐색 구간: [305, 695) x [0, 360)
    SyntheticFace face_;
    std::vector<FaceLandmark> mesh_;
};

TEST_F(HeadTopRefinerTest, NoMaskUsesLandmarkTop) {
    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), nullptr), 300.0);
}

TEST_F(HeadTopRefinerTest, EmptyMatUsesLandmarkTop) {
    cv::Mat mask;
    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 300.0);
}

TEST_F(HeadTopRefinerTest, HairAboveForeheadRaisesHeadTop) {
    cv::Mat mask = emptyMask();
    cv::rectangle(mask, cv::Rect(400, 250, 200, 900), cv::Scalar(255), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 250.0);
}

TEST_F(HeadTopRefinerTest, AnyPositiveValueIsForeground) {
    cv::Mat mask = emptyMask();
    cv::rectangle(mask, cv::Rect(450, 270, 100, 100), cv::Scalar(1), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 270.0);
}

TEST_F(HeadTopRefinerTest, MaskBelowLandmarkNeverLowersHeadTop) {
    cv::Mat mask = emptyMask();
    cv::rectangle(mask, cv::Rect(400, 320, 200, 800), cv::Scalar(255), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 300.0);
}

TEST_F(HeadTopRefinerTest, ForegroundOutsideWindowIgnored) {
    cv::Mat mask = emptyMask();
    // 가로 구간 밖 (배경 인물 등)
    cv::rectangle(mask, cv::Rect(0, 50, 100, 400), cv::Scalar(255), cv::FILLED);
    // 세로 구간 밖 (이마 + 5% 아래)
    cv::rectangle(mask, cv::Rect(400, 400, 200, 100), cv::Scalar(255), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 300.0);
}

TEST_F(HeadTopRefinerTest, PaddingExtendsHorizontalWindow) {
    cv::Mat mask = emptyMask();
    // 윤곽 밖이지만 15% 여유 안 (x = 310)
    cv::rectangle(mask, cv::Rect(310, 200, 10, 10), cv::Scalar(255), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 200.0);
}

TEST_F(HeadTopRefinerTest, AllZeroMaskFallsBack) {
    cv::Mat mask = emptyMask();
    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 300.0);
}

TEST_F(HeadTopRefinerTest, MultiChannelMaskUsesFirstChannel) {
    cv::Mat mask = cv::Mat::zeros(face_.image_height, face_.image_width, CV_8UC3);
    cv::rectangle(mask, cv::Rect(400, 240, 200, 900), cv::Scalar(255, 0, 0), cv::FILLED);
    // 두 번째 채널만 있는 영역은 무시
    cv::rectangle(mask, cv::Rect(400, 100, 200, 50), cv::Scalar(0, 255, 0), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 240.0);
}

TEST_F(HeadTopRefinerTest, SmallerMaskScansOverlapOnly) {
    cv::Mat mask = cv::Mat::zeros(600, 600, CV_8UC1);
    cv::rectangle(mask, cv::Rect(400, 280, 100, 100), cv::Scalar(255), cv::FILLED);

    std::vector<TraceEvent> events;
    TraceHook hook = [&events](const TraceEvent& e) { events.push_back(e); };

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask, hook), 280.0);

    bool warned = false;
    for (const auto& e : events) {
        if (e.level == TraceLevel::Warning && e.message.find("mask dimensions") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(HeadTopRefinerTest, FloatMaskSupported) {
    cv::Mat mask = cv::Mat::zeros(face_.image_height, face_.image_width, CV_32FC1);
    cv::rectangle(mask, cv::Rect(400, 260, 200, 900), cv::Scalar(0.8), cv::FILLED);

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask), 260.0);
}

// ============================================================
// 가로 탐색 구간 퇴화
// ============================================================

TEST_F(HeadTopRefinerTest, CollinearContourWidensToFullWidth) {
    // 관자놀이/윤곽 점이 모두 x = 500 -> 구간 [500, 500)
    for (int idx : topology::FACE_CONTOUR) {
        mesh_[static_cast<size_t>(idx)].x = 0.5f;
    }
    cv::Mat mask = emptyMask();
    // 정상 구간 [305, 695) 였다면 무시될 위치
    cv::rectangle(mask, cv::Rect(50, 230, 30, 30), cv::Scalar(255), cv::FILLED);

    std::vector<TraceEvent> events;
    TraceHook hook = [&events](const TraceEvent& e) { events.push_back(e); };

    EXPECT_DOUBLE_EQ(refineHeadTop(landmarks(), &mask, hook), 230.0);
    EXPECT_TRUE(hasEvent(events, TraceLevel::Warning, "degenerate horizontal search window [500, 500)"));
}

TEST_F(HeadTopRefinerTest, SingleContourPointWidensToFullWidth) {
    // 0..10 번만 있는 메시: 윤곽은 이마 10번 한 점뿐
    mesh_ = makeFaceMesh(face_, 11);
    const NormalizedLandmarks lm = landmarks();
    ASSERT_EQ(lm.points(FaceRegion::FaceContour).size(), 1u);
    EXPECT_FALSE(lm.has(FaceRegion::TempleLeft));
    EXPECT_FALSE(lm.has(FaceRegion::TempleRight));

    cv::Mat mask = emptyMask();
    cv::rectangle(mask, cv::Rect(900, 220, 50, 50), cv::Scalar(255), cv::FILLED);

    std::vector<TraceEvent> events;
    TraceHook hook = [&events](const TraceEvent& e) { events.push_back(e); };

    EXPECT_DOUBLE_EQ(refineHeadTop(lm, &mask, hook), 220.0);
    EXPECT_TRUE(hasEvent(events, TraceLevel::Warning, "widened to full width"));
}

} // namespace testing
} // namespace idphoto_sdk
