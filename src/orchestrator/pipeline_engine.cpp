// EN: Pipeline engine - validates a workflow, resolves stage dispatch and runs stages on the worker pool
// FR: Moteur de pipeline - valide un workflow, résout le dispatch des étapes et les exécute sur le pool

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>
#include <condition_variable>
#include <sstream>

namespace CIP {
namespace Orchestrator {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string text;
    for (const auto& item : items) {
        text += (text.empty() ? "" : separator) + item;
    }
    return text;
}

int readInt(const ConfigManager& config, const std::string& section, const std::string& key, int fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto number = value.tryAs<int>()) {
        return *number;
    }
    throw std::invalid_argument(section + "." + key + " must be an integer, got '" + value.toString() + "'");
}

std::string readString(const ConfigManager& config, const std::string& section, const std::string& key,
                       const std::string& fallback) {
    ConfigValue value = config.get(section, key);
    return value.isValid() && !value.rawText().empty() ? value.rawText() : fallback;
}

} // namespace

std::optional<PipelineStageStatus> PipelineRunResult::statusOf(const std::string& stage_id) const {
    auto it = stages.find(stage_id);
    if (it == stages.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

class PipelineEngine::PipelineEngineImpl {
public:
    PipelineEngineImpl(const Config& config, std::shared_ptr<const SecretProvider> secrets,
                       FanoutDispatcher dispatcher)
        : config_(config),
          dispatcher_(std::move(dispatcher)),
          store_(config.artifact_dir, config.artifact_retention_days),
          driver_(makeDriverConfig(config), store_, std::move(secrets)) {
        if (config_.max_parallel_stages == 0) {
            throw std::invalid_argument("max_parallel_stages must be at least 1");
        }
    }

    ValidationResult validate(const WorkflowDefinition& workflow) const {
        ValidationResult result;
        result.errors = PipelineUtils::validateWorkflow(workflow);

        for (const auto& stage : workflow.stages) {
            if (!stage.suite) {
                continue;
            }
            const auto& rules = dispatcher_.rules();
            bool has_rule = std::any_of(rules.begin(), rules.end(),
                                        [&stage](const SuiteRule& rule) { return rule.suite == *stage.suite; });
            if (!has_rule) {
                result.errors.push_back("stage " + stage.id + ": no dispatch rule for suite " +
                                        WorkflowUtils::suiteToString(*stage.suite));
            }
        }

        bool has_aggregate = std::any_of(workflow.stages.begin(), workflow.stages.end(),
                                         [](const PipelineStageConfig& s) { return s.kind == StageKind::AGGREGATE; });
        if (!has_aggregate) {
            result.warnings.push_back("workflow has no aggregate stage; every stage counts towards the result");
        }
        if (workflow.push_branches.empty()) {
            result.warnings.push_back("workflow has no push branches");
        }

        result.is_valid = result.errors.empty();
        return result;
    }

    PipelineRunResult execute(const WorkflowDefinition& workflow, RunInputsPtr inputs) {
        std::lock_guard<std::mutex> run_lock(run_mutex_);

        ValidationResult validation = validate(workflow);
        if (!validation.is_valid) {
            throw WorkflowError("invalid workflow " + workflow.name + ": " + join(validation.errors, "; "));
        }
        for (const auto& warning : validation.warnings) {
            LOG_WARN("pipeline_engine", warning);
        }

        if (!inputs) {
            throw InputError("no run inputs");
        }
        std::vector<std::string> input_errors = inputs->validate(workflow.push_branches);
        if (!input_errors.empty()) {
            throw InputError(join(input_errors, "; "));
        }

        if (inputs->run_id.empty()) {
            auto with_id = std::make_shared<RunInputs>(*inputs);
            with_id->run_id = Logger::getInstance().generateCorrelationId();
            inputs = with_id;
        }

        cancel_requested_.store(false);

        PipelineExecutionContext context(inputs->run_id, inputs);
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            context.setEventCallback(event_callback_);
        }

        PipelineDependencyResolver resolver(workflow.stages);

        PipelineRunResult result;
        result.run_id = inputs->run_id;
        result.workflow_name = workflow.name;
        result.inputs = inputs;
        result.execution_order = resolver.getExecutionOrder();
        result.start_time = context.getStartTime();
        auto started = std::chrono::steady_clock::now();

        LOG_INFO_META("pipeline_engine", "Run started",
                      (std::unordered_map<std::string, std::string>{
                          {"run_id", result.run_id},
                          {"workflow", workflow.name},
                          {"trigger", RunInputsUtils::triggerToString(inputs->trigger)},
                          {"branch", inputs->branch},
                          {"layout", RunInputsUtils::layoutToString(inputs->layout)},
                          {"wpt", RunInputsUtils::wptModeToString(inputs->wpt)}}));
        context.emitEvent(PipelineEventType::RUN_STARTED, "", "", PipelineStageStatus::PENDING, workflow.name);

        schedule(workflow, result, context);

        result.stages = context.getAllStageResults();
        if (result.aggregate_stage.empty()) {
            std::map<std::string, PipelineStageStatus> statuses;
            for (const auto& [stage_id, stage] : result.stages) {
                statuses[stage_id] = stage.status;
            }
            result.aggregate = ResultAggregator::reduce(statuses);
        }

        result.artifacts = store_.list(result.run_id);
        result.end_time = std::chrono::system_clock::now();
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        std::unordered_map<std::string, std::string> metadata = {
            {"run_id", result.run_id},
            {"success", result.aggregate.success ? "true" : "false"},
            {"cancelled", result.cancelled ? "true" : "false"},
            {"duration", PipelineUtils::formatDuration(result.duration)}
        };
        if (result.aggregate.success) {
            LOG_INFO_META("pipeline_engine", "Run succeeded", metadata);
        } else {
            metadata["failing_stages"] = join(result.aggregate.failing_stages, ",");
            LOG_ERROR_META("pipeline_engine", "Run failed", metadata);
        }
        context.emitEvent(PipelineEventType::RUN_COMPLETED, result.aggregate_stage, "",
                          result.aggregate.success ? PipelineStageStatus::SUCCESS : PipelineStageStatus::FAILURE,
                          result.aggregate.success ? "success" : join(result.aggregate.failing_stages, ","));
        return result;
    }

    std::vector<PlannedStage> plan(const WorkflowDefinition& workflow, const RunInputs& inputs) const {
        ValidationResult validation = validate(workflow);
        if (!validation.is_valid) {
            throw WorkflowError("invalid workflow " + workflow.name + ": " + join(validation.errors, "; "));
        }

        PipelineDependencyResolver resolver(workflow.stages);
        std::set<std::string> dispatched;
        std::vector<PlannedStage> planned;

        for (const auto& stage_id : resolver.getExecutionOrder()) {
            const PipelineStageConfig* stage = workflow.findStage(stage_id);
            PlannedStage entry;
            entry.stage_id = stage->id;
            entry.name = stage->name;
            entry.kind = stage->kind;
            entry.needs = stage->needs;

            if (stage->kind == StageKind::AGGREGATE) {
                entry.dispatched = true;
                entry.reason = "aggregates " + join(stage->needs, ", ");
                dispatched.insert(stage->id);
                planned.push_back(entry);
                continue;
            }

            auto blocked = std::find_if(stage->needs.begin(), stage->needs.end(),
                                        [&dispatched](const std::string& need) { return dispatched.count(need) == 0; });
            if (blocked != stage->needs.end()) {
                entry.reason = "dependency " + *blocked + " is not dispatched";
            } else if (stage->suite && !dispatcher_.isSelected(inputs, *stage->suite)) {
                entry.reason = "suite " + WorkflowUtils::suiteToString(*stage->suite) + " not selected";
            } else {
                entry.dispatched = true;
                entry.reason = stage->suite ? "suite " + WorkflowUtils::suiteToString(*stage->suite) + " selected"
                                            : "unconditional";
                if (stage->suite) {
                    DispatchParameters params = dispatcher_.dispatchParameters(inputs, *stage->suite);
                    entry.parameters = {{"wpt", params.wpt}, {"layout", params.layout}};
                }
                for (const auto& step : stage->steps) {
                    if (step.condition.evaluate(inputs)) {
                        entry.steps.push_back(step.id);
                    }
                }
                dispatched.insert(stage->id);
            }
            planned.push_back(entry);
        }

        return planned;
    }

    void cancel() {
        if (!cancel_requested_.exchange(true)) {
            LOG_WARN("pipeline_engine", "Cancellation requested");
        }
        state_changed_.notify_all();
    }

    bool isCancelled() const { return cancel_requested_.load(); }

    void setEventCallback(PipelineEventCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        event_callback_ = std::move(callback);
    }

    const Config& getConfig() const { return config_; }
    const FanoutDispatcher& getDispatcher() const { return dispatcher_; }
    ArtifactStore& getArtifactStore() { return store_; }

private:
    static StageDriverConfig makeDriverConfig(const Config& config) {
        StageDriverConfig driver_config;
        driver_config.workspace = config.workspace;
        driver_config.log_dir = config.log_dir;
        driver_config.kill_grace = config.kill_grace;
        driver_config.poll_interval = config.poll_interval;
        return driver_config;
    }

    void recordStage(PipelineExecutionContext& context, const PipelineStageConfig& stage,
                     PipelineStageStatus status, const std::string& reason) {
        PipelineStageResult stage_result;
        stage_result.stage_id = stage.id;
        stage_result.status = status;
        stage_result.error_message = reason;
        stage_result.start_time = std::chrono::system_clock::now();
        stage_result.end_time = stage_result.start_time;
        context.updateStageResult(stage_result);
    }

    // EN: Resolve every stage exactly once: skip, dispatch, cancel or aggregate.
    //     Called with no stage running; returns when every stage is terminal.
    // FR: Résout chaque étape exactement une fois : skip, dispatch, annulation ou agrégation.
    //     Appelé sans étape en cours ; retourne quand chaque étape est terminale.
    void schedule(const WorkflowDefinition& workflow, PipelineRunResult& result, PipelineExecutionContext& context) {
        ThreadPoolConfig pool_config;
        pool_config.threads = config_.max_parallel_stages;
        pool_config.max_queue_size = 0;
        ThreadPool pool(pool_config);

        std::vector<std::future<void>> futures;
        std::map<std::string, PipelineStageStatus> statuses;
        for (const auto& stage_id : result.execution_order) {
            statuses[stage_id] = PipelineStageStatus::PENDING;
        }
        size_t running = 0;
        bool cancel_handled = false;

        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (config_.global_timeout.count() > 0) {
            deadline = std::chrono::steady_clock::now() + config_.global_timeout;
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        while (true) {
            if (deadline && !cancel_requested_.load() && std::chrono::steady_clock::now() >= *deadline) {
                LOG_ERROR("pipeline_engine", "Global timeout of " +
                          PipelineUtils::formatDuration(config_.global_timeout) + " reached");
                cancel_requested_.store(true);
            }

            if (!cancel_handled && cancel_requested_.load()) {
                cancel_handled = true;
                result.cancelled = true;
                context.requestCancellation();
                for (const auto& stage_id : result.execution_order) {
                    const PipelineStageConfig* stage = workflow.findStage(stage_id);
                    if (statuses[stage_id] == PipelineStageStatus::PENDING && stage->kind != StageKind::AGGREGATE) {
                        statuses[stage_id] = PipelineStageStatus::CANCELLED;
                        recordStage(context, *stage, PipelineStageStatus::CANCELLED, "run cancelled before dispatch");
                        context.emitEvent(PipelineEventType::STAGE_COMPLETED, stage_id, "",
                                          PipelineStageStatus::CANCELLED, "run cancelled before dispatch");
                    }
                }
                LOG_WARN_META("pipeline_engine", "Run cancelled",
                              (std::unordered_map<std::string, std::string>{
                                  {"run_id", result.run_id},
                                  {"running_stages", std::to_string(running)}}));
                context.emitEvent(PipelineEventType::RUN_CANCELLED, "", "", PipelineStageStatus::CANCELLED,
                                  "run cancelled");
            }

            bool progressed = false;
            for (const auto& stage_id : result.execution_order) {
                if (statuses[stage_id] != PipelineStageStatus::PENDING) {
                    continue;
                }
                const PipelineStageConfig* stage = workflow.findStage(stage_id);
                // EN: A callback may cancel mid-pass; the next pass marks what is left
                // FR: Un callback peut annuler en cours de passe ; la passe suivante marque le reste
                if (!cancel_handled && cancel_requested_.load() && stage->kind != StageKind::AGGREGATE) {
                    progressed = true;
                    break;
                }
                bool ready = std::all_of(stage->needs.begin(), stage->needs.end(), [&statuses](const std::string& need) {
                    return PipelineUtils::isTerminal(statuses[need]);
                });
                if (!ready) {
                    continue;
                }
                progressed = true;

                if (stage->kind == StageKind::AGGREGATE) {
                    aggregate(*stage, statuses, result, context);
                    continue;
                }

                auto unmet = std::find_if(stage->needs.begin(), stage->needs.end(), [&statuses](const std::string& need) {
                    return statuses[need] != PipelineStageStatus::SUCCESS;
                });
                if (unmet != stage->needs.end()) {
                    skip(*stage, "dependency " + *unmet + " is " + PipelineUtils::statusToString(statuses[*unmet]),
                         statuses, context);
                    continue;
                }
                if (stage->suite && !dispatcher_.isSelected(context.getInputs(), *stage->suite)) {
                    skip(*stage, "suite " + WorkflowUtils::suiteToString(*stage->suite) + " not selected",
                         statuses, context);
                    continue;
                }

                std::optional<DispatchParameters> params;
                if (stage->suite) {
                    params = dispatcher_.dispatchParameters(context.getInputs(), *stage->suite);
                }

                statuses[stage_id] = PipelineStageStatus::DISPATCHED;
                ++running;
                LOG_INFO_META("pipeline_engine", "Stage dispatched",
                              (std::unordered_map<std::string, std::string>{
                                  {"stage", stage_id},
                                  {"layout", params ? params->layout : ""},
                                  {"wpt", params ? params->wpt : ""}}));
                context.emitEvent(PipelineEventType::STAGE_DISPATCHED, stage_id, "", PipelineStageStatus::DISPATCHED,
                                  params ? params->layout : "");

                futures.push_back(pool.submitNamed(stage_id, TaskPriority::NORMAL,
                    [this, stage, params, &statuses, &running, &context]() {
                        runStage(*stage, params, statuses, running, context);
                    }));
            }

            bool pending = std::any_of(statuses.begin(), statuses.end(), [](const auto& entry) {
                return entry.second == PipelineStageStatus::PENDING;
            });
            if (!pending && running == 0) {
                break;
            }
            if (!progressed) {
                state_changed_.wait_for(lock, config_.poll_interval);
            }
        }
        lock.unlock();

        for (auto& future : futures) {
            future.get();
        }
        pool.shutdown();
    }

    void runStage(const PipelineStageConfig& stage, const std::optional<DispatchParameters>& params,
                  std::map<std::string, PipelineStageStatus>& statuses, size_t& running,
                  PipelineExecutionContext& context) {
        PipelineStageResult stage_result;
        try {
            WorkflowUtils::PlaceholderValues values = StageDriver::placeholderValues(context.getInputs(), params);
            stage_result = driver_.run(stage, context.getInputs(), values,
                [this]() { return cancel_requested_.load(); },
                [&context](const std::string& stage_id, const StepResult& step, bool started) {
                    context.emitEvent(started ? PipelineEventType::STEP_STARTED : PipelineEventType::STEP_COMPLETED,
                                      stage_id, step.step_id, step.status, step.error_message);
                });
        } catch (const std::exception& e) {
            LOG_ERROR("pipeline_engine", "Stage " + stage.id + " aborted: " + e.what());
            stage_result.stage_id = stage.id;
            stage_result.status = PipelineStageStatus::FAILURE;
            stage_result.error_message = e.what();
        }
        if (params) {
            stage_result.parameters = {{"wpt", params->wpt}, {"layout", params->layout}};
        }
        context.updateStageResult(stage_result);

        LOG_INFO_META("pipeline_engine", "Stage completed",
                      (std::unordered_map<std::string, std::string>{
                          {"stage", stage.id},
                          {"status", PipelineUtils::statusToString(stage_result.status)},
                          {"duration", PipelineUtils::formatDuration(stage_result.execution_time)}}));
        context.emitEvent(PipelineEventType::STAGE_COMPLETED, stage.id, "", stage_result.status,
                          stage_result.error_message);

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            statuses[stage.id] = stage_result.status;
            --running;
        }
        state_changed_.notify_all();
    }

    void skip(const PipelineStageConfig& stage, const std::string& reason,
              std::map<std::string, PipelineStageStatus>& statuses, PipelineExecutionContext& context) {
        statuses[stage.id] = PipelineStageStatus::SKIPPED;
        recordStage(context, stage, PipelineStageStatus::SKIPPED, reason);
        LOG_INFO_META("pipeline_engine", "Stage skipped",
                      (std::unordered_map<std::string, std::string>{{"stage", stage.id}, {"reason", reason}}));
        context.emitEvent(PipelineEventType::STAGE_SKIPPED, stage.id, "", PipelineStageStatus::SKIPPED, reason);
    }

    void aggregate(const PipelineStageConfig& stage, std::map<std::string, PipelineStageStatus>& statuses,
                   PipelineRunResult& result, PipelineExecutionContext& context) {
        std::map<std::string, PipelineStageStatus> observed;
        for (const auto& need : stage.needs) {
            observed[need] = statuses[need];
        }

        result.aggregate = ResultAggregator::reduce(observed);
        result.aggregate_stage = stage.id;

        PipelineStageStatus status = result.aggregate.success ? PipelineStageStatus::SUCCESS
                                                              : PipelineStageStatus::FAILURE;
        statuses[stage.id] = status;
        std::string reason = result.aggregate.success
            ? std::string()
            : "failing stages: " + join(result.aggregate.failing_stages, ", ");
        recordStage(context, stage, status, reason);
        context.emitEvent(PipelineEventType::STAGE_COMPLETED, stage.id, "", status, reason);
    }

    Config config_;
    FanoutDispatcher dispatcher_;
    ArtifactStore store_;
    StageDriver driver_;

    std::mutex run_mutex_;
    std::mutex state_mutex_;
    std::condition_variable state_changed_;
    std::atomic<bool> cancel_requested_{false};

    PipelineEventCallback event_callback_;
    std::mutex callback_mutex_;
};

PipelineEngine::Config PipelineEngine::configFrom(const ConfigManager& config) {
    Config result;
    result.workspace = readString(config, "paths", "workspace", result.workspace.string());
    result.artifact_dir = readString(config, "paths", "artifact_dir", result.artifact_dir.string());
    result.log_dir = readString(config, "paths", "log_dir", result.log_dir.string());

    int max_parallel = readInt(config, "engine", "max_parallel_stages", static_cast<int>(result.max_parallel_stages));
    if (max_parallel < 1) {
        throw std::invalid_argument("engine.max_parallel_stages must be at least 1");
    }
    result.max_parallel_stages = static_cast<size_t>(max_parallel);

    int timeout_minutes = readInt(config, "engine", "timeout_minutes", 0);
    if (timeout_minutes < 0) {
        throw std::invalid_argument("engine.timeout_minutes cannot be negative");
    }
    result.global_timeout = std::chrono::minutes(timeout_minutes);

    int kill_grace = readInt(config, "engine", "kill_grace_seconds", 5);
    if (kill_grace < 0) {
        throw std::invalid_argument("engine.kill_grace_seconds cannot be negative");
    }
    result.kill_grace = std::chrono::seconds(kill_grace);

    result.artifact_retention_days = readInt(config, "artifacts", "retention_days", result.artifact_retention_days);
    return result;
}

PipelineEngine::PipelineEngine(const Config& config, std::shared_ptr<const SecretProvider> secrets,
                               FanoutDispatcher dispatcher)
    : impl_(std::make_unique<PipelineEngineImpl>(config, std::move(secrets), std::move(dispatcher))) {
}

PipelineEngine::~PipelineEngine() = default;

PipelineEngine::ValidationResult PipelineEngine::validate(const WorkflowDefinition& workflow) const {
    return impl_->validate(workflow);
}

PipelineRunResult PipelineEngine::execute(const WorkflowDefinition& workflow, RunInputsPtr inputs) {
    return impl_->execute(workflow, std::move(inputs));
}

std::future<PipelineRunResult> PipelineEngine::executeAsync(WorkflowDefinition workflow, RunInputsPtr inputs) {
    return std::async(std::launch::async, [this, workflow = std::move(workflow), inputs = std::move(inputs)]() {
        return impl_->execute(workflow, inputs);
    });
}

std::vector<PlannedStage> PipelineEngine::plan(const WorkflowDefinition& workflow, const RunInputs& inputs) const {
    return impl_->plan(workflow, inputs);
}

void PipelineEngine::cancel() {
    impl_->cancel();
}

bool PipelineEngine::isCancelled() const {
    return impl_->isCancelled();
}

void PipelineEngine::registerEventCallback(PipelineEventCallback callback) {
    impl_->setEventCallback(std::move(callback));
}

void PipelineEngine::unregisterEventCallback() {
    impl_->setEventCallback(nullptr);
}

PipelineEngine::Config PipelineEngine::getConfig() const {
    return impl_->getConfig();
}

const FanoutDispatcher& PipelineEngine::getDispatcher() const {
    return impl_->getDispatcher();
}

ArtifactStore& PipelineEngine::getArtifactStore() {
    return impl_->getArtifactStore();
}

} // namespace Orchestrator
} // namespace CIP
