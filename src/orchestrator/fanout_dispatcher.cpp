// EN: Conformance fan-out dispatch rules
// FR: Règles de dispatch du fan-out de conformité

#include "orchestrator/fanout_dispatcher.hpp"

#include <stdexcept>

namespace CIP {
namespace Orchestrator {

FanoutDispatcher::FanoutDispatcher() : rules_(defaultRules()) {
}

FanoutDispatcher::FanoutDispatcher(std::vector<SuiteRule> rules) : rules_(std::move(rules)) {
}

std::vector<SuiteRule> FanoutDispatcher::defaultRules() {
    return {
        {ConformanceSuite::LAYOUT_2020, "try-wpt-2020", LayoutSelector::LAYOUT_2020, "layout-2020"},
        {ConformanceSuite::LAYOUT_2013, "try-wpt", LayoutSelector::LAYOUT_2013, "layout-2013"},
    };
}

std::set<ConformanceSuite> FanoutDispatcher::selectSuites(const RunInputs& inputs) const {
    std::set<ConformanceSuite> selected;
    for (const auto& rule : rules_) {
        if (isSelected(inputs, rule.suite)) {
            selected.insert(rule.suite);
        }
    }
    return selected;
}

bool FanoutDispatcher::isSelected(const RunInputs& inputs, ConformanceSuite suite) const {
    const SuiteRule* rule = findRule(suite);
    if (!rule) {
        return false;
    }
    return inputs.branch == rule->trigger_branch ||
           inputs.layout == rule->selector ||
           inputs.layout == LayoutSelector::ALL;
}

DispatchParameters FanoutDispatcher::dispatchParameters(const RunInputs& inputs, ConformanceSuite suite) const {
    const SuiteRule* rule = findRule(suite);
    if (!rule) {
        throw std::invalid_argument("no dispatch rule for suite " + WorkflowUtils::suiteToString(suite));
    }
    return {RunInputsUtils::wptModeToString(inputs.wpt), rule->layout_tag};
}

const SuiteRule* FanoutDispatcher::findRule(ConformanceSuite suite) const {
    for (const auto& rule : rules_) {
        if (rule.suite == suite) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace Orchestrator
} // namespace CIP
