#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "orchestrator/run_inputs.hpp"
#include "orchestrator/workflow_definition.hpp"

namespace CIP {
namespace Orchestrator {

// EN: When to dispatch one conformance suite
// FR: Quand dispatcher une suite de conformité
struct SuiteRule {
    ConformanceSuite suite;
    std::string trigger_branch;     // EN: Push branch that always selects it / FR: Branche de push qui la sélectionne toujours
    LayoutSelector selector;        // EN: Layout input that selects it / FR: Entrée layout qui la sélectionne
    std::string layout_tag;         // EN: Fixed layout parameter of the sub-pipeline / FR: Paramètre layout fixe du sous-pipeline
};

// EN: Parameters bound to a dispatched fan-out stage
// FR: Paramètres liés à une étape de fan-out dispatchée
struct DispatchParameters {
    std::string wpt;
    std::string layout;
};

// EN: Decides which conformance suites a run dispatches. Pure function of the run inputs.
// FR: Décide quelles suites de conformité une exécution dispatche. Fonction pure des entrées.
class FanoutDispatcher {
public:
    FanoutDispatcher();
    explicit FanoutDispatcher(std::vector<SuiteRule> rules);

    // EN: A suite is selected iff branch == trigger_branch, layout == selector, or layout == ALL
    // FR: Une suite est sélectionnée ssi branch == trigger_branch, layout == selector, ou layout == ALL
    std::set<ConformanceSuite> selectSuites(const RunInputs& inputs) const;

    bool isSelected(const RunInputs& inputs, ConformanceSuite suite) const;

    // EN: {wpt: run mode, layout: fixed tag}. Throws std::invalid_argument for a suite without rule.
    // FR: {wpt: mode de l'exécution, layout: tag fixe}. Lance std::invalid_argument pour une suite sans règle.
    DispatchParameters dispatchParameters(const RunInputs& inputs, ConformanceSuite suite) const;

    const std::vector<SuiteRule>& rules() const { return rules_; }

    static std::vector<SuiteRule> defaultRules();

private:
    const SuiteRule* findRule(ConformanceSuite suite) const;

    std::vector<SuiteRule> rules_;
};

} // namespace Orchestrator
} // namespace CIP
