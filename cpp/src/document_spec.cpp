/**
 * @file document_spec.cpp
 * @brief 문서 규격 변환 및 카탈로그 구현
 */

#include "idphoto_sdk/document_spec.h"

#include <algorithm>
#include <cctype>

#include <opencv2/core.hpp>

namespace idphoto_sdk {

namespace {

/// 최상위 규격 목록 키
constexpr const char* SPECS_KEY = "document_specs";

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool sameKey(const PhysicalDocumentSpec& spec,
             const std::string& country_code,
             const std::string& document_name) {
    return toLower(spec.country_code) == toLower(country_code) &&
           toLower(spec.document_name) == toLower(document_name);
}

// ============================================================
// FileStorage 읽기 헬퍼
// ============================================================

bool isNumber(const cv::FileNode& node) {
    return node.isReal() || node.isInt();
}

bool readRequiredString(const cv::FileNode& item, const char* key, std::string& out) {
    const cv::FileNode node = item[key];
    if (!node.isString()) {
        return false;
    }
    out = static_cast<std::string>(node);
    return !out.empty();
}

bool readRequiredNumber(const cv::FileNode& item, const char* key, double& out) {
    const cv::FileNode node = item[key];
    if (!isNumber(node)) {
        return false;
    }
    out = static_cast<double>(node);
    return true;
}

/// 키가 없으면 성공 (값 유지), 숫자가 아니면 실패
bool readOptionalNumber(const cv::FileNode& item, const char* key, std::optional<double>& out) {
    const cv::FileNode node = item[key];
    if (node.empty() || node.isNone()) {
        return true;
    }
    if (!isNumber(node)) {
        return false;
    }
    out = static_cast<double>(node);
    return true;
}

bool readOptionalInt(const cv::FileNode& item, const char* key, int& out) {
    const cv::FileNode node = item[key];
    if (node.empty() || node.isNone()) {
        return true;
    }
    if (!node.isInt()) {
        return false;
    }
    out = static_cast<int>(node);
    return true;
}

bool readOptionalReal(const cv::FileNode& item, const char* key, double& out) {
    std::optional<double> value;
    if (!readOptionalNumber(item, key, value)) {
        return false;
    }
    if (value) {
        out = *value;
    }
    return true;
}

bool readOptionalString(const cv::FileNode& item, const char* key, std::string& out) {
    const cv::FileNode node = item[key];
    if (node.empty() || node.isNone()) {
        return true;
    }
    if (!node.isString()) {
        return false;
    }
    out = static_cast<std::string>(node);
    return true;
}

/**
 * @brief 단일 규격 항목 파싱
 */
bool parseSpec(const cv::FileNode& item, PhysicalDocumentSpec& spec) {
    if (!item.isMap()) {
        return false;
    }

    bool ok = readRequiredString(item, "country_code", spec.country_code)
           && readRequiredString(item, "document_name", spec.document_name)
           && readRequiredNumber(item, "photo_width_mm", spec.photo_width_mm)
           && readRequiredNumber(item, "photo_height_mm", spec.photo_height_mm)
           && readOptionalInt(item, "dpi", spec.dpi)
           && readOptionalNumber(item, "head_min_mm", spec.head_min_mm)
           && readOptionalNumber(item, "head_max_mm", spec.head_max_mm)
           && readOptionalNumber(item, "head_min_percentage", spec.head_min_percentage)
           && readOptionalNumber(item, "head_max_percentage", spec.head_max_percentage)
           && readOptionalNumber(item, "eye_min_from_bottom_mm", spec.eye_min_from_bottom_mm)
           && readOptionalNumber(item, "eye_max_from_bottom_mm", spec.eye_max_from_bottom_mm)
           && readOptionalNumber(item, "eye_min_from_top_mm", spec.eye_min_from_top_mm)
           && readOptionalNumber(item, "eye_max_from_top_mm", spec.eye_max_from_top_mm)
           && readOptionalNumber(item, "head_top_min_dist_mm", spec.head_top_min_dist_mm)
           && readOptionalNumber(item, "head_top_max_dist_mm", spec.head_top_max_dist_mm)
           && readOptionalInt(item, "min_visual_head_margin_px", spec.min_visual_head_margin_px)
           && readOptionalInt(item, "min_visual_chin_margin_px", spec.min_visual_chin_margin_px)
           && readOptionalReal(item, "default_head_top_margin_percent", spec.default_head_top_margin_percent)
           && readOptionalString(item, "background_color", spec.background_color)
           && readOptionalString(item, "glasses_allowed", spec.glasses_allowed);

    return ok && spec.dpi > 0 && spec.photo_width_mm > 0.0 && spec.photo_height_mm > 0.0;
}

} // namespace

// ============================================================
// DocumentSpec
// ============================================================

bool DocumentSpec::isValid(std::string* reason) const {
    auto fail = [reason](const char* message) {
        if (reason) {
            *reason = message;
        }
        return false;
    };

    if (photo_width_px <= 0 || photo_height_px <= 0) {
        return fail("Photo dimensions must be positive.");
    }
    if (head_min_px <= 0 || head_max_px <= 0) {
        return fail("Head min/max px not defined.");
    }
    if (head_max_px < head_min_px) {
        return fail("Head max px is smaller than head min px.");
    }
    return true;
}

// ============================================================
// PhysicalDocumentSpec
// ============================================================

int PhysicalDocumentSpec::mmToPx(double mm) const {
    return static_cast<int>(mm / MM_PER_INCH * static_cast<double>(dpi));
}

DocumentSpec PhysicalDocumentSpec::toPixelSpec() const {
    DocumentSpec spec;
    spec.photo_width_px = mmToPx(photo_width_mm);
    spec.photo_height_px = mmToPx(photo_height_mm);

    const double photo_height_px = static_cast<double>(spec.photo_height_px);

    // 머리 높이: mm 우선, 없으면 비율
    if (head_min_mm) {
        spec.head_min_px = mmToPx(*head_min_mm);
    } else if (head_min_percentage) {
        spec.head_min_px = static_cast<int>(photo_height_px * *head_min_percentage);
    }
    if (head_max_mm) {
        spec.head_max_px = mmToPx(*head_max_mm);
    } else if (head_max_percentage) {
        spec.head_max_px = static_cast<int>(photo_height_px * *head_max_percentage);
    }

    // 눈높이: 하단 기준 우선, 없으면 상단 기준을 하단 기준으로 변환
    if (eye_min_from_bottom_mm) {
        spec.eye_min_from_bottom_px = mmToPx(*eye_min_from_bottom_mm);
    }
    if (eye_max_from_bottom_mm) {
        spec.eye_max_from_bottom_px = mmToPx(*eye_max_from_bottom_mm);
    }
    if (!eye_min_from_bottom_mm && !eye_max_from_bottom_mm) {
        if (eye_max_from_top_mm) {
            spec.eye_min_from_bottom_px = spec.photo_height_px - mmToPx(*eye_max_from_top_mm);
        }
        if (eye_min_from_top_mm) {
            spec.eye_max_from_bottom_px = spec.photo_height_px - mmToPx(*eye_min_from_top_mm);
        }
    }

    if (head_top_min_dist_mm) {
        spec.head_top_min_dist_px = mmToPx(*head_top_min_dist_mm);
    }
    if (head_top_max_dist_mm) {
        spec.head_top_max_dist_px = mmToPx(*head_top_max_dist_mm);
    }

    spec.min_visual_head_margin_px = min_visual_head_margin_px;
    spec.min_visual_chin_margin_px = min_visual_chin_margin_px;
    spec.default_head_top_margin_percent = default_head_top_margin_percent;
    return spec;
}

// ============================================================
// DocumentSpecCatalog
// ============================================================

DocumentSpecCatalog DocumentSpecCatalog::builtin() {
    DocumentSpecCatalog catalog;

    // US Passport: 2x2 inch, 머리 25~35mm, 눈 하단 기준 28~35mm
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "US";
        spec.document_name = "Passport";
        spec.photo_width_mm = 50.8;
        spec.photo_height_mm = 50.8;
        spec.head_min_mm = 25.0;
        spec.head_max_mm = 35.0;
        spec.eye_min_from_bottom_mm = 28.0;
        spec.eye_max_from_bottom_mm = 35.0;
        catalog.add(spec);

        // US Visa: 인쇄 규격은 여권과 동일
        spec.document_name = "Visa";
        catalog.add(spec);
    }

    // US Visa Lottery (DV): 머리 높이 50~69%
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "US";
        spec.document_name = "Visa Lottery";
        spec.photo_width_mm = 50.8;
        spec.photo_height_mm = 50.8;
        spec.head_min_percentage = 0.50;
        spec.head_max_percentage = 0.69;
        spec.eye_min_from_bottom_mm = 28.4;
        spec.eye_max_from_bottom_mm = 35.1;
        catalog.add(spec);

        // US Green Card: DV 규격 + 머리 상단 거리 5~12mm
        spec.document_name = "Green Card";
        spec.head_top_min_dist_mm = 5.0;
        spec.head_top_max_dist_mm = 12.0;
        catalog.add(spec);
    }

    // Schengen Visa: 35x45mm, 머리 32~36mm, 눈 29~34mm, 머리 위 여백 0 허용
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "DE_schengen";
        spec.document_name = "Visa";
        spec.photo_width_mm = 35.0;
        spec.photo_height_mm = 45.0;
        spec.head_min_mm = 32.0;
        spec.head_max_mm = 36.0;
        spec.eye_min_from_bottom_mm = 29.0;
        spec.eye_max_from_bottom_mm = 34.0;
        // 머리 위 2~6mm 는 넣지 않음: HeadTopDistance 가 눈 규칙보다 우선하게 됨
        spec.min_visual_head_margin_px = 0;
        spec.background_color = "light_grey";
        spec.glasses_allowed = "yes";
        catalog.add(spec);
    }

    // GB Passport: 35x45mm, 머리 29~34mm
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "GB";
        spec.document_name = "Passport";
        spec.photo_width_mm = 35.0;
        spec.photo_height_mm = 45.0;
        spec.head_min_mm = 29.0;
        spec.head_max_mm = 34.0;
        spec.eye_min_from_bottom_mm = 25.0;
        spec.eye_max_from_bottom_mm = 31.0;
        spec.background_color = "light_grey";
        spec.glasses_allowed = "yes";
        catalog.add(spec);
    }

    // IN Passport: 51x51mm, 머리 65~75%, 머리 상단 거리 3~5mm
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "IN";
        spec.document_name = "Passport";
        spec.photo_width_mm = 51.0;
        spec.photo_height_mm = 51.0;
        spec.head_min_percentage = 0.65;
        spec.head_max_percentage = 0.75;
        spec.head_top_min_dist_mm = 3.0;
        spec.head_top_max_dist_mm = 5.0;
        catalog.add(spec);
    }

    // CA Passport: 50x70mm, 머리 31~36mm, 눈 상단 기준 17~23mm
    {
        PhysicalDocumentSpec spec;
        spec.country_code = "CA";
        spec.document_name = "Passport";
        spec.photo_width_mm = 50.0;
        spec.photo_height_mm = 70.0;
        spec.head_min_mm = 31.0;
        spec.head_max_mm = 36.0;
        spec.eye_min_from_top_mm = 17.0;
        spec.eye_max_from_top_mm = 23.0;
        catalog.add(spec);
    }

    return catalog;
}

void DocumentSpecCatalog::add(const PhysicalDocumentSpec& spec) {
    auto it = std::find_if(specs_.begin(), specs_.end(), [&spec](const PhysicalDocumentSpec& existing) {
        return sameKey(existing, spec.country_code, spec.document_name);
    });
    if (it != specs_.end()) {
        *it = spec;
    } else {
        specs_.push_back(spec);
    }
}

const PhysicalDocumentSpec* DocumentSpecCatalog::find(const std::string& country_code,
                                                      const std::string& document_name) const {
    for (const auto& spec : specs_) {
        if (sameKey(spec, country_code, document_name)) {
            return &spec;
        }
    }
    return nullptr;
}

bool DocumentSpecCatalog::loadFromFile(const std::string& path, ErrorCode* error) {
    auto fail = [error](ErrorCode code) {
        if (error) {
            *error = code;
        }
        return false;
    };

    if (path.empty()) {
        return fail(ErrorCode::SpecFileOpenFailed);
    }

    std::vector<PhysicalDocumentSpec> loaded;
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            return fail(ErrorCode::SpecFileOpenFailed);
        }

        const cv::FileNode list = fs[SPECS_KEY];
        if (!list.isSeq()) {
            return fail(ErrorCode::SpecFileMalformed);
        }

        for (cv::FileNodeIterator it = list.begin(); it != list.end(); ++it) {
            PhysicalDocumentSpec spec;
            if (!parseSpec(*it, spec)) {
                return fail(ErrorCode::SpecFileMalformed);
            }
            loaded.push_back(spec);
        }
    } catch (const cv::Exception&) {
        // 파싱 오류는 FileStorage 생성자에서 예외로 보고됨
        return fail(ErrorCode::SpecFileMalformed);
    }

    for (const auto& spec : loaded) {
        add(spec);
    }
    if (error) {
        *error = ErrorCode::Success;
    }
    return true;
}

} // namespace idphoto_sdk
