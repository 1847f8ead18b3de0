// EN: Pipeline Execution Context implementation - per-run stage results, cancellation flag and events
// FR: Implémentation Pipeline Execution Context - résultats par étape, drapeau d'annulation et événements

#include "orchestrator/pipeline_engine.hpp"

namespace CIP {
namespace Orchestrator {

PipelineExecutionContext::PipelineExecutionContext(const std::string& run_id, RunInputsPtr inputs)
    : run_id_(run_id), inputs_(std::move(inputs)), start_time_(std::chrono::system_clock::now()) {
}

void PipelineExecutionContext::updateStageResult(const PipelineStageResult& result) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    stage_results_[result.stage_id] = result;
}

std::optional<PipelineStageResult> PipelineExecutionContext::getStageResult(const std::string& stage_id) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = stage_results_.find(stage_id);
    if (it == stage_results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, PipelineStageResult> PipelineExecutionContext::getAllStageResults() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return stage_results_;
}

PipelineStageStatus PipelineExecutionContext::getStageStatus(const std::string& stage_id) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = stage_results_.find(stage_id);
    return it != stage_results_.end() ? it->second.status : PipelineStageStatus::PENDING;
}

void PipelineExecutionContext::requestCancellation() {
    cancelled_.store(true);
}

bool PipelineExecutionContext::isCancelled() const {
    return cancelled_.load();
}

void PipelineExecutionContext::setEventCallback(PipelineEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void PipelineExecutionContext::emitEvent(PipelineEventType type, const std::string& stage_id,
                                         const std::string& step_id, PipelineStageStatus status,
                                         const std::string& message) {
    PipelineEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (!callback) {
        return;
    }

    PipelineEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.run_id = run_id_;
    event.stage_id = stage_id;
    event.step_id = step_id;
    event.status = status;
    event.message = message;

    try {
        callback(event);
    } catch (const std::exception& e) {
        LOG_WARN("pipeline_engine", "Event callback threw: " + std::string(e.what()));
    }
}

} // namespace Orchestrator
} // namespace CIP
