#include "report/TemplateResolver.hpp"
#include "core/Logger.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace report {

namespace {

constexpr const char* YAML_HEADER = "%YAML:1.0";

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

/**
 * Validate one metric block against its level family.
 * Returns nothing and fills `error` when the block cannot be used.
 */
std::optional<TemplateSet::LevelMap> parseMetric(const cv::FileNode& node, Category category, std::string& error) {
    if (node.empty() || node.isNone()) {
        error = "missing";
        return std::nullopt;
    }
    if (!node.isMap()) {
        error = "not a mapping";
        return std::nullopt;
    }

    const auto& levels = TemplateSet::levelsFor(category);
    const auto& fields = TemplateSet::fieldNames();
    TemplateSet::LevelMap out;

    for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
        const cv::FileNode levelNode = *it;
        const std::string level = levelNode.name();
        if (!contains(levels, level)) {
            core::Logger::debug("TemplateResolver: ignoring unknown level '", level, "' of ",
                                analysis::categoryName(category));
            continue;
        }
        if (!levelNode.isMap()) {
            error = "level '" + level + "' is not a mapping";
            return std::nullopt;
        }
        for (cv::FileNodeIterator f = levelNode.begin(); f != levelNode.end(); ++f) {
            const cv::FileNode fieldNode = *f;
            const std::string field = fieldNode.name();
            if (!contains(fields, field)) continue;
            if (!fieldNode.isString() || fieldNode.string().empty()) {
                error = level + "." + field + " is not a text";
                return std::nullopt;
            }
            out[level][field] = fieldNode.string();
        }
    }

    // Every text the defaults provide is required
    const TemplateSet::LevelMap* required = TemplateSet::builtin().metric(category);
    if (required) {
        for (const auto& [level, fieldMap] : *required) {
            for (const auto& [field, text] : fieldMap) {
                auto lit = out.find(level);
                if (lit == out.end() || lit->second.count(field) == 0) {
                    error = "missing required field " + level + "." + field;
                    return std::nullopt;
                }
            }
        }
    }
    return out;
}

std::optional<RuleTemplate> parseRule(const cv::FileNode& node, const RuleTemplate& fallback, std::string& error) {
    if (node.empty() || node.isNone()) {
        error = "missing";
        return std::nullopt;
    }

    RuleTemplate rule = fallback;
    if (node.isString()) {
        rule.text = node.string();
    } else if (node.isMap()) {
        const cv::FileNode text = node["text"];
        if (!text.isString()) {
            error = "no 'text' entry";
            return std::nullopt;
        }
        rule.text = text.string();

        const std::pair<core::Side, const char*> labels[] = {
            {core::Side::Left, "side_left"}, {core::Side::Right, "side_right"}, {core::Side::None, "side_none"}
        };
        for (const auto& [side, key] : labels) {
            const cv::FileNode label = node[key];
            if (label.empty() || label.isNone()) continue;
            if (!label.isString()) {
                error = std::string(key) + " is not a text";
                return std::nullopt;
            }
            rule.sideLabels[side] = label.string();
        }
    } else {
        error = "neither a text nor a mapping";
        return std::nullopt;
    }

    if (rule.text.empty()) {
        error = "empty text";
        return std::nullopt;
    }
    return rule;
}

void warnUnknownKeys(const cv::FileNode& section, const std::string& sectionName,
                     const std::vector<std::string>& known) {
    for (cv::FileNodeIterator it = section.begin(); it != section.end(); ++it) {
        const std::string key = (*it).name();
        if (!contains(known, key)) {
            core::Logger::debug("TemplateResolver: ignoring unknown entry ", sectionName, ".", key);
        }
    }
}

} // namespace

// ============================================================
// Loading
// ============================================================

TemplateResolver::Shared TemplateResolver::defaults() {
    static const Shared set = std::make_shared<const TemplateSet>(TemplateSet::builtin());
    return set;
}

TemplateResolver::Shared TemplateResolver::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        core::Logger::warn("TemplateResolver: cannot read ", path, ", using compiled-in templates");
        auto set = std::make_shared<TemplateSet>(TemplateSet::builtin());
        set->source_ = path;
        set->issues_.push_back({"document", "file not readable"});
        return set;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str(), path);
}

TemplateResolver::Shared TemplateResolver::loadFromString(const std::string& text, const std::string& source) {
    const TemplateSet& builtin = TemplateSet::builtin();

    TemplateSet parsed = builtin;
    parsed.source_ = source;
    parsed.issues_.clear();

    auto issue = [&parsed](const std::string& entry, const std::string& message) {
        core::Logger::warn("TemplateResolver: ", parsed.source_, ": ", entry, " ", message, ", using default");
        parsed.issues_.push_back({entry, message});
    };

    // cv::FileStorage wants the YAML directive
    std::string doc = text;
    if (doc.compare(0, 5, "%YAML") != 0) {
        doc = std::string(YAML_HEADER) + "\n" + doc;
    }

    try {
        cv::FileStorage fs(doc, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_YAML);
        if (!fs.isOpened()) {
            core::Logger::error("TemplateResolver: ", source, " could not be opened, using compiled-in templates");
            auto set = std::make_shared<TemplateSet>(builtin);
            set->source_ = source;
            set->issues_.push_back({"document", "not readable as YAML"});
            return set;
        }

        // --- Metrics ---
        const cv::FileNode metrics = fs["metrics"];
        if (!metrics.isMap()) {
            issue("metrics", "section missing");
        } else {
            std::vector<std::string> known;
            for (Category c : analysis::allCategories()) {
                const std::string name = analysis::categoryName(c);
                known.push_back(name);

                std::string error;
                auto levels = parseMetric(metrics[name], c, error);
                if (levels) {
                    parsed.metrics_[c] = std::move(*levels);
                } else {
                    issue("metrics." + name, error);
                }
            }
            warnUnknownKeys(metrics, "metrics", known);
        }

        // --- Condition rules ---
        auto loadRules = [&](const char* sectionName, const std::vector<std::string>& ids,
                             std::map<std::string, RuleTemplate>& target,
                             const std::map<std::string, RuleTemplate>& fallback) {
            const cv::FileNode section = fs[sectionName];
            if (!section.isMap()) {
                issue(sectionName, "section missing");
                return;
            }
            for (const auto& id : ids) {
                std::string error;
                auto rule = parseRule(section[id], fallback.at(id), error);
                if (rule) {
                    target[id] = std::move(*rule);
                } else {
                    issue(std::string(sectionName) + "." + id, error);
                }
            }
            warnUnknownKeys(section, sectionName, ids);
        };

        loadRules("opportunities", TemplateSet::opportunityIds(), parsed.opportunities_, builtin.opportunities_);
        loadRules("threats", TemplateSet::threatIds(), parsed.threats_, builtin.threats_);
    } catch (const cv::Exception& e) {
        core::Logger::error("TemplateResolver: ", source, " is not valid YAML (", e.what(),
                            "), using compiled-in templates");
        auto set = std::make_shared<TemplateSet>(builtin);
        set->source_ = source;
        set->issues_.push_back({"document", "parse error"});
        return set;
    }

    core::Logger::info("TemplateResolver: loaded ", source, " (", parsed.issues_.size(), " fallbacks)");
    return std::make_shared<const TemplateSet>(std::move(parsed));
}

// ============================================================
// Rendering
// ============================================================

std::string TemplateResolver::formatNumber(double value) {
    if (!std::isfinite(value)) return "n/a";

    const double rounded = std::round(value);
    if (std::abs(value - rounded) < 1e-9) {
        return std::to_string(static_cast<long long>(rounded));
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}

RenderOutcome TemplateResolver::render(const std::string& templ, const std::map<std::string, double>& values,
                                       const std::map<std::string, std::string>& words) {
    RenderOutcome outcome;
    std::string out;
    out.reserve(templ.size());

    size_t pos = 0;
    while (pos < templ.size()) {
        const size_t open = templ.find('{', pos);
        if (open == std::string::npos) {
            out.append(templ, pos, std::string::npos);
            break;
        }
        const size_t close = templ.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(templ, pos, std::string::npos);
            break;
        }

        out.append(templ, pos, open - pos);
        const std::string name = templ.substr(open + 1, close - open - 1);

        auto w = words.find(name);
        auto v = values.find(name);
        if (w != words.end()) {
            out += w->second;
        } else if (v != values.end()) {
            out += formatNumber(v->second);
        } else {
            outcome.missing.push_back(name);
        }
        pos = close + 1;
    }

    if (!outcome.missing.empty()) {
        std::string names;
        for (const auto& m : outcome.missing) {
            names += (names.empty() ? "" : ", ") + m;
        }
        core::Logger::warn("TemplateResolver: no value for {", names, "}, leaving template unrendered");
        outcome.text = templ;
        outcome.complete = false;
        return outcome;
    }

    outcome.text = std::move(out);
    return outcome;
}

std::optional<RenderOutcome> TemplateResolver::render(const TemplateSet& set, Category category,
                                                      const std::string& level, const std::string& field,
                                                      const std::map<std::string, double>& raw) {
    const std::string* text = set.text(category, level, field);
    if (!text) return std::nullopt;
    return render(*text, raw);
}

} // namespace report
