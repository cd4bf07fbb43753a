#include "report/TemplateSet.hpp"

namespace report {

using core::Side;

const std::string* TemplateSet::text(Category category, const std::string& level, const std::string& field) const {
    const LevelMap* levels = metric(category);
    if (!levels) return nullptr;
    auto lit = levels->find(level);
    if (lit == levels->end()) return nullptr;
    auto fit = lit->second.find(field);
    return fit == lit->second.end() ? nullptr : &fit->second;
}

const TemplateSet::LevelMap* TemplateSet::metric(Category category) const {
    auto it = metrics_.find(category);
    return it == metrics_.end() ? nullptr : &it->second;
}

const RuleTemplate* TemplateSet::opportunity(const std::string& id) const {
    auto it = opportunities_.find(id);
    return it == opportunities_.end() ? nullptr : &it->second;
}

const RuleTemplate* TemplateSet::threat(const std::string& id) const {
    auto it = threats_.find(id);
    return it == threats_.end() ? nullptr : &it->second;
}

const std::vector<std::string>& TemplateSet::levelsFor(Category category) {
    static const std::vector<std::string> generic = {"excellent", "good", "medium", "poor"};
    static const std::vector<std::string> exhaustion = {"low", "moderate", "high", "critical"};
    static const std::vector<std::string> arms = {"optimal", "acceptable", "overloaded", "critical"};
    static const std::vector<std::string> legs = {"optimal", "good", "underused", "passive"};

    switch (category) {
        case Category::Exhaustion:    return exhaustion;
        case Category::ArmEfficiency: return arms;
        case Category::LegEfficiency: return legs;
        default:                      return generic;
    }
}

const std::vector<std::string>& TemplateSet::fieldNames() {
    static const std::vector<std::string> fields = {STRENGTH, WEAKNESS};
    return fields;
}

const std::vector<std::string>& TemplateSet::opportunityIds() {
    static const std::vector<std::string> ids = {
        "hip_position", "quiet_feet", "grip_release", "leg_efficiency", "rhythm", "dynamic_control"
    };
    return ids;
}

const std::vector<std::string>& TemplateSet::threatIds() {
    static const std::vector<std::string> ids = {
        "shoulder", "elbow", "knee_rotation", "lower_back", "exhaustion_critical", "instability", "fall"
    };
    return ids;
}

const TemplateSet& TemplateSet::builtin() {
    static const TemplateSet set = makeBuiltin();
    return set;
}

TemplateSet TemplateSet::makeBuiltin() {
    TemplateSet t;
    t.source_ = "builtin";

    auto& m = t.metrics_;

    m[Category::QuietFeet] = {
        {"excellent", {{STRENGTH, "Precise footwork {score}%: feet land on the hold first time, saving energy."}}},
        {"good", {{STRENGTH, "Footwork {score}%: few repositions, which saves strength."}}},
        {"medium", {{WEAKNESS, "Foot repositioning {score}%: {repositions} moves per hold instead of {norm}. It eats energy."}}},
        {"poor", {{WEAKNESS, "Feet are searching for holds: {score}%. {repositions} repositions instead of {norm}. Critical for progress."}}},
    };
    m[Category::HipPosition] = {
        {"excellent", {{STRENGTH, "Hip position {score}%: weight on the feet, arms resting. Excellent technique."}}},
        {"good", {{STRENGTH, "Hip position {score}%: slight deviation, good overall."}}},
        {"medium", {{WEAKNESS, "Hips off the wall: {score}% ({angle} deg). Arms carry an extra {overload}% of body weight."}}},
        {"poor", {{WEAKNESS, "Hips far from the wall: {score}% ({angle} deg). Arms overloaded by {overload}%. Main area for growth."}}},
    };
    m[Category::Diagonal] = {
        {"excellent", {{STRENGTH, "Counterbalance {score}%: excellent diagonal movement, stable balance."}}},
        {"good", {{STRENGTH, "Counterbalance {score}%: the diagonal works, balance is good."}}},
        {"medium", {{WEAKNESS, "Counterbalance {score}%: square movements, the body swings."}}},
        {"poor", {{WEAKNESS, "No diagonal: {score}%. Chaotic movement, a lot of energy spent on stabilizing."}}},
    };
    m[Category::RouteReading] = {
        {"excellent", {{STRENGTH, "Route reading {score}%: you plan the route and take pauses. A sign of an experienced climber."}}},
        {"good", {{STRENGTH, "Route reading {score}%: there is planning, you do not climb blind."}}},
        {"medium", {{WEAKNESS, "Route reading {score}%: few pauses to look ahead. Add planning."}}},
        {"poor", {{WEAKNESS, "Impulsive climbing: {score}%. You rush the route without a plan."}}},
    };
    m[Category::Rhythm] = {
        {"excellent", {{STRENGTH, "Rhythm {score}%: even movements, full control."}}},
        {"good", {{STRENGTH, "Rhythm {score}%: steady pace with small fluctuations."}}},
        {"medium", {{WEAKNESS, "Rhythm {score}%: the pace breaks on hard sections. Spread +/-{variance}ms."}}},
        {"poor", {{WEAKNESS, "Broken rhythm: {score}%. Spread +/-{variance}ms. A sign of stress or panic."}}},
    };
    m[Category::DynamicControl] = {
        {"excellent", {{STRENGTH, "Dynamic control {score}%: you stabilize immediately after throws."}}},
        {"good", {{STRENGTH, "Dynamic control {score}%: dynamic moves are under control."}}},
        {"medium", {{WEAKNESS, "Dynamic control {score}%: after throws you take a while to catch balance ({time}s)."}}},
        {"poor", {{WEAKNESS, "Losing control after throws: {score}%. Stabilizing takes {time}s instead of 0.5s."}}},
    };
    m[Category::GripRelease] = {
        {"excellent", {{STRENGTH, "Grip changes {score}%: smooth, soft movements. Energy saved."}}},
        {"good", {{STRENGTH, "Grip changes {score}%: hand movements are smooth enough."}}},
        {"medium", {{WEAKNESS, "Grip changes {score}%: jerks on release cost you balance."}}},
        {"poor", {{WEAKNESS, "Abrupt grip changes: {score}%. You yank off holds, losing balance and energy."}}},
    };
    m[Category::Stability] = {
        {"excellent", {{STRENGTH, "Stability {score}%: the body stays put, minimum wasted movement."}}},
        {"good", {{STRENGTH, "Stability {score}%: good position control."}}},
        {"medium", {{WEAKNESS, "Stability {score}%: the body wanders, lots of micro-corrections."}}},
        {"poor", {{WEAKNESS, "Stability {score}%: a lot of energy goes into keeping balance."}}},
    };
    m[Category::Exhaustion] = {
        {"low", {{STRENGTH, "Endurance {score}%: movement quality holds up to the top."}}},
        {"moderate", {{WEAKNESS, "Fatigue {percent}%: quality dips in the second half of the route."}}},
        {"high", {{WEAKNESS, "Fatigue {percent}%: movement quality drops noticeably towards the finish."}}},
        {"critical", {{WEAKNESS, "Exhaustion {percent}%: the last part of the route is in the red zone."}}},
    };
    m[Category::ArmEfficiency] = {
        {"optimal", {{STRENGTH, "Arms carry {arm_load}% of the load: within the 30-40% norm."}}},
        {"overloaded", {{WEAKNESS, "Arms overloaded: {arm_load}% instead of 30-40%. Shift weight onto the feet."}}},
        {"critical", {{WEAKNESS, "Arms {arm_load}%: critical overload. Technique needs work."}}},
    };
    m[Category::LegEfficiency] = {
        {"optimal", {{STRENGTH, "Legs carry {leg_load}% of the load: strong push from the feet."}}},
        {"underused", {{WEAKNESS, "Legs carry only {leg_load}%: underused. Push harder with the feet."}}},
        {"passive", {{WEAKNESS, "Legs {leg_load}%: barely working. Main area for growth."}}},
    };

    auto opp = [&t](const std::string& id, const std::string& text) {
        t.opportunities_[id] = RuleTemplate{id, text, {}};
    };
    opp("hip_position", "Bring hip position up to {target}% and your arms will tire {reduction}% less.");
    opp("quiet_feet", "Working on foot precision removes {saved} extra moves per route, saving {energy}% energy.");
    opp("grip_release", "Smooth grip changes are worth a full grade. Right now this is your ceiling.");
    opp("leg_efficiency", "Legs carry only {current}% of the weight. Get that to 65% and overhangs open up.");
    opp("rhythm", "An even rhythm cuts energy use by {saved}% and removes panic on hard sections.");
    opp("dynamic_control", "Stabilize after throws in {target_time}s instead of {time}s to save {saved_time}s per move.");

    const std::map<Side, std::string> sides = {
        {Side::Left, "Left"}, {Side::Right, "Right"}, {Side::None, "Each"}
    };
    auto threat = [&t, &sides](const std::string& id, const std::string& text) {
        t.threats_[id] = RuleTemplate{id, text, sides};
    };
    threat("shoulder", "{side} shoulder locked at {count} points of the route. Impingement risk if the pattern persists.");
    threat("elbow", "{side} elbow: angles below 70 deg under load {count} times. Risk of climber's elbow (epicondylitis).");
    threat("knee_rotation", "{side} knee rotated under load {count} times. Meniscus injury risk.");
    threat("lower_back", "Lower back twisted {angle} deg under load. Disc protrusion risk if the pattern becomes chronic.");
    threat("exhaustion_critical", "Exhaustion {percent}%: the last part of the route is in the red zone. Loss of control means fall risk.");
    threat("instability", "Stability {score}%: strong instability and high energy cost. Injury risk on unstable moves.");
    threat("fall", "Uncontrolled fall at {time}s ({count} this attempt). Practice falling: feet down first, hands off the wall.");

    return t;
}

} // namespace report
