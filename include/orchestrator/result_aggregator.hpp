#pragma once

#include <map>
#include <string>
#include <vector>

#include "orchestrator/pipeline_types.hpp"

namespace CIP {
namespace Orchestrator {

// EN: Overall outcome of a run, derived from the terminal statuses of the aggregated stages
// FR: Résultat global d'une exécution, dérivé des statuts terminaux des étapes agrégées
struct AggregateResult {
    bool success = true;
    std::vector<std::string> failing_stages;                 // EN: Sorted by stage id / FR: Triées par id
    std::map<std::string, PipelineStageStatus> observed;

    int exitCode() const { return success ? 0 : 1; }
};

// EN: Reduces stage statuses to a single pass/fail signal.
//     SUCCESS and SKIPPED pass; FAILURE and CANCELLED fail.
// FR: Réduit les statuts des étapes à un unique signal succès/échec.
//     SUCCESS et SKIPPED passent ; FAILURE et CANCELLED échouent.
class ResultAggregator {
public:
    // EN: Throws std::invalid_argument if a status is not terminal.
    // FR: Lance std::invalid_argument si un statut n'est pas terminal.
    static AggregateResult reduce(const std::map<std::string, PipelineStageStatus>& statuses);

    static bool isFailing(PipelineStageStatus status);
};

} // namespace Orchestrator
} // namespace CIP
