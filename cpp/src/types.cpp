/**
 * @file types.cpp
 * @brief 버전 정보 및 타입 문자열 변환 구현
 */

#include "idphoto_sdk.h"
#include "idphoto_sdk/types.h"

#include <algorithm>
#include <cstdio>

namespace idphoto_sdk {

const char* get_version() {
    return IDPHOTO_SDK_VERSION_STRING;
}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidParameter: return "InvalidParameter";
        case ErrorCode::InvalidDocumentSpec: return "InvalidDocumentSpec";
        case ErrorCode::EssentialLandmarkMissing: return "EssentialLandmarkMissing";
        case ErrorCode::InvalidHeadHeight: return "InvalidHeadHeight";
        case ErrorCode::SpecFileOpenFailed: return "SpecFileOpenFailed";
        case ErrorCode::SpecFileMalformed: return "SpecFileMalformed";
        case ErrorCode::Unknown:
        default:
            return "Unknown";
    }
}

const char* toString(PositioningRule rule) {
    switch (rule) {
        case PositioningRule::HeadTopDistance: return "HeadTopDistance";
        case PositioningRule::EyeFromBottom: return "EyeFromBottom";
        case PositioningRule::DefaultMargin: return "DefaultMargin";
        case PositioningRule::NotSet:
        default:
            return "NotSet";
    }
}

const char* toString(MarginCorrection correction) {
    switch (correction) {
        case MarginCorrection::HeadMarginFix: return "HeadMarginFix";
        case MarginCorrection::ChinMarginFix: return "ChinMarginFix";
        default: return "Unknown";
    }
}

// ============================================================
// PositioningMethod
// ============================================================

bool PositioningMethod::hasCorrection(MarginCorrection correction) const {
    return std::find(corrections.begin(), corrections.end(), correction) != corrections.end();
}

std::string PositioningMethod::toString() const {
    std::string text = idphoto_sdk::toString(rule);

    if (rule != PositioningRule::NotSet) {
        char buf[48];
        std::snprintf(buf, sizeof(buf), " (%.1fpx)", parameter_px);
        text += buf;
    }

    for (MarginCorrection correction : corrections) {
        text += " +";
        text += idphoto_sdk::toString(correction);
    }
    return text;
}

} // namespace idphoto_sdk
