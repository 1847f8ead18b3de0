// EN: Result aggregator implementation
// FR: Implémentation de l'agrégateur de résultats

#include "orchestrator/result_aggregator.hpp"

#include <stdexcept>

namespace CIP {
namespace Orchestrator {

AggregateResult ResultAggregator::reduce(const std::map<std::string, PipelineStageStatus>& statuses) {
    AggregateResult result;
    result.observed = statuses;

    for (const auto& [stage_id, status] : statuses) {
        if (!PipelineUtils::isTerminal(status)) {
            throw std::invalid_argument("stage '" + stage_id + "' is not terminal (" +
                                        PipelineUtils::statusToString(status) + ")");
        }
        if (isFailing(status)) {
            result.failing_stages.push_back(stage_id);
        }
    }

    result.success = result.failing_stages.empty();
    return result;
}

bool ResultAggregator::isFailing(PipelineStageStatus status) {
    return status == PipelineStageStatus::FAILURE || status == PipelineStageStatus::CANCELLED;
}

} // namespace Orchestrator
} // namespace CIP
