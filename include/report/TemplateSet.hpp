#pragma once

#include "analysis/Categories.hpp"
#include "core/Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace report {

using analysis::Category;

/**
 * A template entry that could not be used as written.
 * Recorded on the loaded set and logged; never thrown.
 */
struct TemplateIssue {
    std::string entry;      // e.g. "metrics.hip_position", "threats.shoulder"
    std::string message;
};

/**
 * Text of one condition rule (opportunity or threat).
 * The predicate and calculation are compiled; only the wording is data.
 */
struct RuleTemplate {
    std::string id;
    std::string text;
    std::map<core::Side, std::string> sideLabels;   // threats only
};

/**
 * Strongly typed template set: metric -> level -> field -> text.
 *
 * Field names are fixed ("strength", "weakness") and each category family
 * has a fixed set of levels. Immutable once loaded; sessions share it
 * through std::shared_ptr<const TemplateSet>.
 */
class TemplateSet {
public:
    using FieldMap = std::map<std::string, std::string>;
    using LevelMap = std::map<std::string, FieldMap>;

    static constexpr const char* STRENGTH = "strength";
    static constexpr const char* WEAKNESS = "weakness";

    [[nodiscard]] const std::string* text(Category category, const std::string& level, const std::string& field) const;
    [[nodiscard]] const LevelMap* metric(Category category) const;
    [[nodiscard]] const RuleTemplate* opportunity(const std::string& id) const;
    [[nodiscard]] const RuleTemplate* threat(const std::string& id) const;

    [[nodiscard]] const std::vector<TemplateIssue>& issues() const { return issues_; }
    [[nodiscard]] const std::string& source() const { return source_; }

    /**
     * Compiled-in defaults; the fallback for every entry.
     */
    [[nodiscard]] static const TemplateSet& builtin();

    /**
     * Valid levels of a category's bucket family
     */
    [[nodiscard]] static const std::vector<std::string>& levelsFor(Category category);
    [[nodiscard]] static const std::vector<std::string>& fieldNames();

    [[nodiscard]] static const std::vector<std::string>& opportunityIds();
    [[nodiscard]] static const std::vector<std::string>& threatIds();

private:
    friend class TemplateResolver;

    std::map<Category, LevelMap> metrics_;
    std::map<std::string, RuleTemplate> opportunities_;
    std::map<std::string, RuleTemplate> threats_;
    std::vector<TemplateIssue> issues_;
    std::string source_ = "builtin";

    static TemplateSet makeBuiltin();
};

} // namespace report
