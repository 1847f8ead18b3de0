#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/artifact_store.hpp"
#include "orchestrator/fanout_dispatcher.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/result_aggregator.hpp"
#include "orchestrator/run_inputs.hpp"
#include "orchestrator/stage_driver.hpp"
#include "orchestrator/workflow_definition.hpp"

namespace CIP {
namespace Orchestrator {

// EN: Forward declarations
// FR: Déclarations avancées
class PipelineDependencyResolver;
class PipelineExecutionContext;

// EN: Event types for pipeline execution monitoring
// FR: Types d'événements pour le monitoring de l'exécution du pipeline
enum class PipelineEventType {
    RUN_STARTED,
    STAGE_DISPATCHED,
    STAGE_SKIPPED,
    STAGE_COMPLETED,
    STEP_STARTED,
    STEP_COMPLETED,
    RUN_CANCELLED,
    RUN_COMPLETED
};

// EN: Event data for pipeline monitoring
// FR: Données d'événement pour le monitoring du pipeline
struct PipelineEvent {
    PipelineEventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string run_id;
    std::string stage_id;
    std::string step_id;
    PipelineStageStatus status = PipelineStageStatus::PENDING;
    std::string message;
};

// EN: Callback function type for pipeline events
// FR: Type de fonction de rappel pour les événements du pipeline
using PipelineEventCallback = std::function<void(const PipelineEvent&)>;

// EN: Everything a finished run produced
// FR: Tout ce qu'une exécution terminée a produit
struct PipelineRunResult {
    std::string run_id;
    std::string workflow_name;
    RunInputsPtr inputs;
    std::vector<std::string> execution_order;
    std::map<std::string, PipelineStageResult> stages;
    std::vector<ArtifactManifest> artifacts;
    AggregateResult aggregate;
    std::string aggregate_stage;        // EN: Empty when the workflow has none / FR: Vide si le workflow n'en a pas
    bool cancelled = false;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};

    bool isSuccess() const { return aggregate.success; }
    int exitCode() const { return aggregate.exitCode(); }
    std::optional<PipelineStageStatus> statusOf(const std::string& stage_id) const;
};

// EN: What a run would do, assuming every dispatched stage succeeds
// FR: Ce que ferait une exécution, en supposant que chaque étape dispatchée réussit
struct PlannedStage {
    std::string stage_id;
    std::string name;
    StageKind kind = StageKind::STEPS;
    bool dispatched = false;
    std::string reason;
    std::vector<std::string> needs;
    std::map<std::string, std::string> parameters;
    std::vector<std::string> steps;             // EN: Steps whose condition holds / FR: Steps dont la condition est vraie
};

// EN: Main pipeline engine class for orchestrating execution
// FR: Classe principale du moteur de pipeline pour orchestrer l'exécution
class PipelineEngine {
public:
    struct Config {
        size_t max_parallel_stages = std::max(1u, std::thread::hardware_concurrency());
        std::filesystem::path workspace = ".";
        std::filesystem::path artifact_dir = "artifacts";
        std::filesystem::path log_dir = "logs";
        int artifact_retention_days = 90;
        std::chrono::milliseconds kill_grace{5000};
        std::chrono::milliseconds poll_interval{50};
        std::chrono::seconds global_timeout{0};          // EN: 0 disables it / FR: 0 le désactive
    };

    // EN: Read the "paths", "engine" and "artifacts" sections
    // FR: Lit les sections "paths", "engine" et "artifacts"
    static Config configFrom(const ConfigManager& config);

    explicit PipelineEngine(const Config& config,
                            std::shared_ptr<const SecretProvider> secrets = nullptr,
                            FanoutDispatcher dispatcher = FanoutDispatcher());
    ~PipelineEngine();

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    // EN: Pipeline validation
    // FR: Validation de pipeline
    struct ValidationResult {
        bool is_valid = false;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ValidationResult validate(const WorkflowDefinition& workflow) const;

    // EN: Run a workflow to completion. Throws WorkflowError or InputError before any stage runs.
    //     One run at a time per engine.
    // FR: Exécute un workflow jusqu'au bout. Lance WorkflowError ou InputError avant toute étape.
    //     Une exécution à la fois par moteur.
    PipelineRunResult execute(const WorkflowDefinition& workflow, RunInputsPtr inputs);
    std::future<PipelineRunResult> executeAsync(WorkflowDefinition workflow, RunInputsPtr inputs);

    std::vector<PlannedStage> plan(const WorkflowDefinition& workflow, const RunInputs& inputs) const;

    // EN: Pipeline control: stop dispatching, cancel running steps
    // FR: Contrôle : arrête le dispatch, annule les steps en cours
    void cancel();
    bool isCancelled() const;

    void registerEventCallback(PipelineEventCallback callback);
    void unregisterEventCallback();

    Config getConfig() const;
    const FanoutDispatcher& getDispatcher() const;
    ArtifactStore& getArtifactStore();

private:
    // EN: Internal implementation
    // FR: Implémentation interne
    class PipelineEngineImpl;
    std::unique_ptr<PipelineEngineImpl> impl_;
};

// EN: Dependency resolution utility class
// FR: Classe utilitaire de résolution de dépendances
class PipelineDependencyResolver {
public:
    explicit PipelineDependencyResolver(const std::vector<PipelineStageConfig>& stages);

    // EN: Topological order, ties broken by declaration order. Throws WorkflowError on a cycle.
    // FR: Ordre topologique, égalités départagées par l'ordre de déclaration. Lance WorkflowError sur un cycle.
    std::vector<std::string> getExecutionOrder() const;
    std::vector<std::vector<std::string>> getExecutionLevels() const;

    bool hasCircularDependency() const;
    // EN: One cycle as a path whose first and last ids are equal; empty without cycle
    // FR: Un cycle sous forme de chemin dont le premier et le dernier id sont égaux ; vide sans cycle
    std::vector<std::string> getCircularDependencies() const;

    // EN: "stage -> need" for every need that names no stage
    // FR: "stage -> need" pour chaque need qui ne désigne aucune étape
    std::vector<std::string> getMissingDependencies() const;

    std::vector<std::string> getDependents(const std::string& stage_id) const;
    std::vector<std::string> getDependencies(const std::string& stage_id) const;
    bool canExecute(const std::string& stage_id, const std::set<std::string>& terminal_stages) const;

private:
    std::vector<std::string> order_;            // EN: Declaration order / FR: Ordre de déclaration
    std::unordered_map<std::string, std::vector<std::string>> dependency_graph_;
    std::unordered_map<std::string, std::vector<std::string>> reverse_dependency_graph_;

    void buildDependencyGraph(const std::vector<PipelineStageConfig>& stages);
    bool detectCircularDependencyDFS(const std::string& node,
                                     std::unordered_map<std::string, int>& colors,
                                     std::vector<std::string>& path) const;
};

// EN: Execution context for one pipeline run
// FR: Contexte d'exécution pour une exécution de pipeline
class PipelineExecutionContext {
public:
    PipelineExecutionContext(const std::string& run_id, RunInputsPtr inputs);
    ~PipelineExecutionContext() = default;

    // EN: Context accessors
    // FR: Accesseurs de contexte
    const std::string& getRunId() const { return run_id_; }
    const RunInputs& getInputs() const { return *inputs_; }
    RunInputsPtr getInputsPtr() const { return inputs_; }
    std::chrono::system_clock::time_point getStartTime() const { return start_time_; }

    // EN: State management
    // FR: Gestion d'état
    void updateStageResult(const PipelineStageResult& result);
    std::optional<PipelineStageResult> getStageResult(const std::string& stage_id) const;
    std::map<std::string, PipelineStageResult> getAllStageResults() const;
    PipelineStageStatus getStageStatus(const std::string& stage_id) const;

    // EN: Execution control
    // FR: Contrôle d'exécution
    void requestCancellation();
    bool isCancelled() const;

    // EN: Event handling
    // FR: Gestion d'événements
    void emitEvent(PipelineEventType type, const std::string& stage_id = "", const std::string& step_id = "",
                   PipelineStageStatus status = PipelineStageStatus::PENDING, const std::string& message = "");
    void setEventCallback(PipelineEventCallback callback);

private:
    std::string run_id_;
    RunInputsPtr inputs_;
    mutable std::mutex results_mutex_;
    std::map<std::string, PipelineStageResult> stage_results_;
    std::atomic<bool> cancelled_{false};
    std::chrono::system_clock::time_point start_time_;
    PipelineEventCallback event_callback_;
    mutable std::mutex callback_mutex_;
};

// EN: Utility functions for pipeline management
// FR: Fonctions utilitaires pour la gestion de pipeline
namespace PipelineUtils {

    // EN: Workflow validation (everything except dispatcher rules)
    // FR: Validation de workflow (tout sauf les règles du dispatcher)
    bool isValidStageId(const std::string& id);
    std::vector<std::string> validateWorkflow(const WorkflowDefinition& workflow);

    // EN: Time and duration utilities
    // FR: Utilitaires de temps et de durée
    std::string formatDuration(std::chrono::milliseconds duration);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

    std::string eventTypeToString(PipelineEventType type);

    // EN: Workflow files (yaml-cpp). Loading throws WorkflowError on malformed input.
    // FR: Fichiers de workflow (yaml-cpp). Le chargement lance WorkflowError sur entrée malformée.
    WorkflowDefinition loadWorkflowFromYAML(const std::string& filepath);
    WorkflowDefinition parseWorkflowYAML(const std::string& content);
    std::string workflowToYAML(const WorkflowDefinition& workflow);
    bool saveWorkflowToYAML(const std::string& filepath, const WorkflowDefinition& workflow);

    // EN: Run report and dispatch plan as JSON
    // FR: Rapport d'exécution et plan de dispatch en JSON
    nlohmann::json inputsToJson(const RunInputs& inputs);
    nlohmann::json runResultToJson(const PipelineRunResult& result);
    nlohmann::json planToJson(const RunInputs& inputs, const std::vector<PlannedStage>& plan);
    bool saveRunReport(const std::string& filepath, const PipelineRunResult& result);

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace CIP
