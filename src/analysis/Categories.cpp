#include "analysis/Categories.hpp"

namespace analysis {

namespace {

constexpr std::array<const char*, CATEGORY_COUNT> CATEGORY_NAMES = {
    "quiet_feet",
    "hip_position",
    "diagonal",
    "route_reading",
    "rhythm",
    "dynamic_control",
    "grip_release",
    "stability",
    "exhaustion",
    "arm_efficiency",
    "leg_efficiency"
};

} // namespace

const char* categoryName(Category category) {
    const auto idx = static_cast<size_t>(category);
    return idx < CATEGORY_COUNT ? CATEGORY_NAMES[idx] : "unknown";
}

std::optional<Category> categoryFromName(const std::string& name) {
    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        if (name == CATEGORY_NAMES[i]) return static_cast<Category>(i);
    }
    return std::nullopt;
}

bool isTechniqueCategory(Category category) {
    return static_cast<size_t>(category) < TECHNIQUE_CATEGORY_COUNT;
}

const std::array<Category, CATEGORY_COUNT>& allCategories() {
    static const std::array<Category, CATEGORY_COUNT> all = {
        Category::QuietFeet, Category::HipPosition, Category::Diagonal, Category::RouteReading,
        Category::Rhythm, Category::DynamicControl, Category::GripRelease,
        Category::Stability, Category::Exhaustion, Category::ArmEfficiency, Category::LegEfficiency
    };
    return all;
}

const std::array<Category, TECHNIQUE_CATEGORY_COUNT>& techniqueCategories() {
    static const std::array<Category, TECHNIQUE_CATEGORY_COUNT> technique = {
        Category::QuietFeet, Category::HipPosition, Category::Diagonal, Category::RouteReading,
        Category::Rhythm, Category::DynamicControl, Category::GripRelease
    };
    return technique;
}

} // namespace analysis
