#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace analysis {

/**
 * Assessment categories.
 * The first seven are technique categories and take part in the weighted
 * overall score; the rest are additional metrics used for SWOT only.
 */
enum class Category : uint8_t {
    QuietFeet = 0,
    HipPosition,
    Diagonal,
    RouteReading,
    Rhythm,
    DynamicControl,
    GripRelease,
    Stability,
    Exhaustion,
    ArmEfficiency,
    LegEfficiency,
    Count
};

constexpr size_t CATEGORY_COUNT = static_cast<size_t>(Category::Count);
constexpr size_t TECHNIQUE_CATEGORY_COUNT = 7;

[[nodiscard]] const char* categoryName(Category category);
[[nodiscard]] std::optional<Category> categoryFromName(const std::string& name);
[[nodiscard]] bool isTechniqueCategory(Category category);
[[nodiscard]] const std::array<Category, CATEGORY_COUNT>& allCategories();
[[nodiscard]] const std::array<Category, TECHNIQUE_CATEGORY_COUNT>& techniqueCategories();

/**
 * Kinematic measurement of one category before normalization.
 * `value` is the quantity the category is scored on; `fields` carries every
 * named value needed for scoring and for template placeholders.
 */
struct RawSignal {
    Category category = Category::QuietFeet;
    double value = 0.0;
    std::map<std::string, double> fields;
    size_t validSamples = 0;

    [[nodiscard]] std::optional<double> field(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }
};

enum class ExtractionStatus : uint8_t {
    Ok = 0,
    InsufficientData
};

struct ExtractionResult {
    Category category = Category::QuietFeet;
    ExtractionStatus status = ExtractionStatus::InsufficientData;
    RawSignal signal;
    std::string reason;

    [[nodiscard]] bool ok() const { return status == ExtractionStatus::Ok; }

    static ExtractionResult success(RawSignal signal) {
        ExtractionResult r;
        r.category = signal.category;
        r.status = ExtractionStatus::Ok;
        r.signal = std::move(signal);
        return r;
    }

    static ExtractionResult insufficient(Category category, std::string reason, size_t validSamples = 0) {
        ExtractionResult r;
        r.category = category;
        r.status = ExtractionStatus::InsufficientData;
        r.signal.category = category;
        r.signal.validSamples = validSamples;
        r.reason = std::move(reason);
        return r;
    }
};

} // namespace analysis
