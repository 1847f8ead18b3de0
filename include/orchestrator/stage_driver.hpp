#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/artifact_store.hpp"
#include "orchestrator/fanout_dispatcher.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/run_inputs.hpp"
#include "orchestrator/workflow_definition.hpp"

namespace CIP {
namespace Orchestrator {

// EN: Source of secret values forwarded to steps. Values are never logged.
// FR: Source des valeurs secrètes transmises aux steps. Les valeurs ne sont jamais journalisées.
class SecretProvider {
public:
    virtual ~SecretProvider() = default;
    virtual std::optional<std::string> getSecret(const std::string& name) const = 0;
};

// EN: Reads secrets from the process environment
// FR: Lit les secrets depuis l'environnement du processus
class EnvironmentSecretProvider : public SecretProvider {
public:
    std::optional<std::string> getSecret(const std::string& name) const override;
};

// EN: Result of a single step
// FR: Résultat d'un step
struct StepResult {
    std::string step_id;
    std::string name;
    PipelineStageStatus status = PipelineStageStatus::PENDING;
    int exit_code = 0;
    std::string log_path;
    std::chrono::milliseconds duration{0};
    std::string error_message;

    bool isSuccess() const { return status == PipelineStageStatus::SUCCESS; }
    bool isFailure() const { return status == PipelineStageStatus::FAILURE; }
};

// EN: Result of a pipeline stage execution
// FR: Résultat de l'exécution d'une étape du pipeline
struct PipelineStageResult {
    std::string stage_id;
    PipelineStageStatus status = PipelineStageStatus::PENDING;
    std::chrono::milliseconds execution_time{0};
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string error_message;                       // EN: Skip reason or first failure / FR: Raison du skip ou premier échec
    std::map<std::string, std::string> parameters;   // EN: Dispatch parameters / FR: Paramètres de dispatch
    std::vector<StepResult> steps;

    bool isSuccess() const { return status == PipelineStageStatus::SUCCESS; }
    bool isFailure() const { return status == PipelineStageStatus::FAILURE; }
};

struct StageDriverConfig {
    std::filesystem::path workspace = ".";
    std::filesystem::path log_dir = "logs";
    std::chrono::milliseconds kill_grace{5000};
    std::chrono::milliseconds poll_interval{50};
};

// EN: Step notifications: started == true before the step runs, false once it has a result
// FR: Notifications de step : started == true avant l'exécution, false une fois le résultat connu
using StepObserver = std::function<void(const std::string& stage_id, const StepResult& step, bool started)>;

// EN: Runs the steps of one stage strictly in order.
//     Fail-fast: after a failure, later steps are skipped unless marked `always`.
//     Always-run steps also run after cancellation and are not interrupted by it.
// FR: Exécute les steps d'une étape strictement dans l'ordre.
//     Fail-fast : après un échec, les steps suivants sont ignorés sauf s'ils sont `always`.
//     Les steps `always` s'exécutent aussi après annulation et ne sont pas interrompus par elle.
class StageDriver {
public:
    using CancelPredicate = std::function<bool()>;

    StageDriver(StageDriverConfig config, ArtifactStore& store,
                std::shared_ptr<const SecretProvider> secrets = nullptr);

    PipelineStageResult run(const PipelineStageConfig& stage, const RunInputs& inputs,
                            const WorkflowUtils::PlaceholderValues& values,
                            const CancelPredicate& is_cancelled = {},
                            const StepObserver& observer = {}) const;

    const StageDriverConfig& getConfig() const { return config_; }

    // EN: Placeholder values of a stage; dispatch parameters override the run's wpt and layout
    // FR: Valeurs des placeholders d'une étape ; les paramètres de dispatch remplacent wpt et layout
    static WorkflowUtils::PlaceholderValues placeholderValues(const RunInputs& inputs,
                                                              const std::optional<DispatchParameters>& dispatch);

    // EN: "<NN>-<step>.log", NN counted from 1
    // FR: "<NN>-<step>.log", NN compté à partir de 1
    static std::string logFileName(size_t index, const std::string& step_id);

private:
    StepResult runStep(const PipelineStageConfig& stage, const PipelineStepConfig& step, size_t index,
                       const RunInputs& inputs, const WorkflowUtils::PlaceholderValues& values,
                       const CancelPredicate& is_cancelled) const;

    void runCommand(const PipelineStepConfig& step, const std::filesystem::path& working_directory,
                    const WorkflowUtils::PlaceholderValues& values, const CancelPredicate& is_cancelled,
                    StepResult& result) const;

    void runArtifactStep(const PipelineStageConfig& stage, const PipelineStepConfig& step,
                         const std::filesystem::path& working_directory, const RunInputs& inputs,
                         const WorkflowUtils::PlaceholderValues& values, StepResult& result) const;

    StageDriverConfig config_;
    ArtifactStore& store_;
    std::shared_ptr<const SecretProvider> secrets_;
    ProcessRunner runner_;
};

} // namespace Orchestrator
} // namespace CIP
