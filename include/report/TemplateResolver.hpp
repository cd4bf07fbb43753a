#pragma once

#include "TemplateSet.hpp"
#include "scoring/Scorer.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace report {

/**
 * Result of substituting `{name}` placeholders.
 * When any placeholder has no value the literal template is returned
 * and `complete` is false.
 */
struct RenderOutcome {
    std::string text;
    bool complete = true;
    std::vector<std::string> missing;
};

/**
 * Template Resolver
 *
 * Loads a YAML template definition through cv::FileStorage and validates it
 * entry by entry against the fixed schema of TemplateSet. A malformed or
 * missing metric, opportunity or threat falls back to the compiled-in
 * entry; siblings are unaffected. Nothing here throws on bad input.
 *
 * Document layout:
 *   metrics:
 *     hip_position:
 *       good: { strength: "..." }
 *   opportunities:
 *     rhythm: "..."
 *   threats:
 *     shoulder: { text: "...", side_left: "Left", side_right: "Right", side_none: "Each" }
 */
class TemplateResolver {
public:
    using Shared = std::shared_ptr<const TemplateSet>;

    /**
     * Read a template file. An absent or unreadable file yields the defaults.
     */
    static Shared load(const std::string& path);

    static Shared loadFromString(const std::string& text, const std::string& source = "<memory>");

    static Shared defaults();

    /**
     * Substitute placeholders from `values`
     */
    static RenderOutcome render(const std::string& templ, const std::map<std::string, double>& values,
                                const std::map<std::string, std::string>& words = {});

    /**
     * Render the (metric, level, field) text of a set against a metric's raw values.
     * Empty when the set has no text for that level and field.
     */
    static std::optional<RenderOutcome> render(const TemplateSet& set, Category category,
                                               const std::string& level, const std::string& field,
                                               const std::map<std::string, double>& raw);

    /**
     * Number as it appears in text: integral values without decimals, others with one
     */
    static std::string formatNumber(double value);
};

} // namespace report
