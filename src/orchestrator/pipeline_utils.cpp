// EN: Pipeline Utils implementation - statuses, workflow validation, YAML workflow files and JSON reports
// FR: Implémentation Pipeline Utils - statuts, validation de workflow, fichiers YAML et rapports JSON

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace CIP {
namespace Orchestrator {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// EN: YAML reading helpers; every failure names the offending location
// FR: Assistants de lecture YAML ; chaque échec nomme l'emplacement fautif
std::string readScalar(const YAML::Node& node, const std::string& key, const std::string& where,
                       bool required = false, const std::string& fallback = "") {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        if (required) {
            throw WorkflowError(where + ": missing '" + key + "'");
        }
        return fallback;
    }
    if (!value.IsScalar()) {
        throw WorkflowError(where + ": '" + key + "' must be a scalar");
    }
    return value.as<std::string>();
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key, const std::string& where) {
    std::vector<std::string> values;
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return values;
    }
    if (value.IsScalar()) {
        values.push_back(value.as<std::string>());
        return values;
    }
    if (!value.IsSequence()) {
        throw WorkflowError(where + ": '" + key + "' must be a list");
    }
    for (const auto& item : value) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

bool readBool(const YAML::Node& node, const std::string& key, const std::string& where) {
    std::string text = toLower(readScalar(node, key, where, false, "false"));
    if (text == "true" || text == "yes" || text == "1") return true;
    if (text == "false" || text == "no" || text == "0") return false;
    throw WorkflowError(where + ": '" + key + "' must be a boolean");
}

ConditionClause parseClause(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap() || node.size() != 1) {
        throw WorkflowError(where + ": each condition clause must be a single-key map");
    }
    auto entry = node.begin();
    std::string kind_text = entry->first.as<std::string>();
    auto kind = WorkflowUtils::parseClauseKind(kind_text);
    if (!kind) {
        throw WorkflowError(where + ": unknown condition '" + kind_text + "'");
    }
    return {*kind, entry->second.as<std::string>()};
}

PipelineStepConfig parseStep(const YAML::Node& node, const std::string& stage_id) {
    if (!node.IsMap()) {
        throw WorkflowError("stage " + stage_id + ": steps must be maps");
    }

    PipelineStepConfig step;
    step.id = readScalar(node, "id", "stage " + stage_id, true);
    const std::string where = "step " + stage_id + "/" + step.id;
    step.name = readScalar(node, "name", where, false, step.id);

    std::string kind_text = readScalar(node, "kind", where, false, "command");
    auto kind = WorkflowUtils::parseStepKind(kind_text);
    if (!kind) {
        throw WorkflowError(where + ": unknown step kind '" + kind_text + "'");
    }
    step.kind = *kind;
    step.run = readScalar(node, "run", where);
    step.always = readBool(node, "always", where);

    if (YAML::Node condition = node["if"]) {
        if (condition.IsSequence()) {
            for (const auto& clause : condition) {
                step.condition.any_of.push_back(parseClause(clause, where));
            }
        } else {
            step.condition.any_of.push_back(parseClause(condition, where));
        }
    }

    if (YAML::Node env = node["env"]) {
        if (!env.IsMap()) {
            throw WorkflowError(where + ": 'env' must be a map");
        }
        for (const auto& entry : env) {
            step.env.emplace_back(entry.first.as<std::string>(), entry.second.as<std::string>());
        }
    }

    step.secrets = readStringList(node, "secrets", where);

    if (YAML::Node artifact = node["artifact"]) {
        if (!artifact.IsMap()) {
            throw WorkflowError(where + ": 'artifact' must be a map");
        }
        ArtifactSpec spec;
        spec.name = readScalar(artifact, "name", where, true);
        spec.path = readScalar(artifact, "path", where, false, ".");
        if (artifact["retention-days"]) {
            spec.retention_days = artifact["retention-days"].as<int>();
        }
        step.artifact = spec;
    }

    if (node["timeout-minutes"]) {
        step.timeout = std::chrono::minutes(node["timeout-minutes"].as<int>());
    }

    return step;
}

PipelineStageConfig parseStage(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw WorkflowError("stages must be maps");
    }

    PipelineStageConfig stage;
    stage.id = readScalar(node, "id", "stage", true);
    const std::string where = "stage " + stage.id;
    stage.name = readScalar(node, "name", where, false, stage.id);

    std::string kind_text = readScalar(node, "kind", where, false, "steps");
    auto kind = WorkflowUtils::parseStageKind(kind_text);
    if (!kind) {
        throw WorkflowError(where + ": unknown stage kind '" + kind_text + "'");
    }
    stage.kind = *kind;
    stage.needs = readStringList(node, "needs", where);
    stage.working_directory = readScalar(node, "working-directory", where);

    std::string suite_text = readScalar(node, "suite", where);
    if (!suite_text.empty()) {
        auto suite = WorkflowUtils::parseSuite(suite_text);
        if (!suite) {
            throw WorkflowError(where + ": unknown suite '" + suite_text + "'");
        }
        stage.suite = *suite;
    }

    if (YAML::Node steps = node["steps"]) {
        if (!steps.IsSequence()) {
            throw WorkflowError(where + ": 'steps' must be a list");
        }
        for (const auto& step : steps) {
            stage.steps.push_back(parseStep(step, stage.id));
        }
    }

    return stage;
}

void checkPlaceholders(const std::string& text, const std::string& where, std::vector<std::string>& errors) {
    const auto& known = WorkflowUtils::knownPlaceholders();
    for (const auto& name : WorkflowUtils::findPlaceholders(text)) {
        if (known.count(name) == 0) {
            errors.push_back(where + ": unknown placeholder '" + name + "'");
        }
    }
}

nlohmann::json stepResultToJson(const StepResult& step) {
    nlohmann::json json;
    json["id"] = step.step_id;
    json["name"] = step.name;
    json["status"] = PipelineUtils::statusToString(step.status);
    json["exit_code"] = step.exit_code;
    json["duration_ms"] = step.duration.count();
    json["log"] = step.log_path;
    if (!step.error_message.empty()) {
        json["error"] = step.error_message;
    }
    return json;
}

} // namespace

namespace PipelineUtils {

std::string statusToString(PipelineStageStatus status) {
    switch (status) {
        case PipelineStageStatus::PENDING: return "pending";
        case PipelineStageStatus::DISPATCHED: return "dispatched";
        case PipelineStageStatus::SUCCESS: return "success";
        case PipelineStageStatus::FAILURE: return "failure";
        case PipelineStageStatus::CANCELLED: return "cancelled";
        case PipelineStageStatus::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

std::optional<PipelineStageStatus> parseStatus(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "pending") return PipelineStageStatus::PENDING;
    if (lower == "dispatched") return PipelineStageStatus::DISPATCHED;
    if (lower == "success") return PipelineStageStatus::SUCCESS;
    if (lower == "failure") return PipelineStageStatus::FAILURE;
    if (lower == "cancelled") return PipelineStageStatus::CANCELLED;
    if (lower == "skipped") return PipelineStageStatus::SKIPPED;
    return std::nullopt;
}

bool isTerminal(PipelineStageStatus status) {
    return status != PipelineStageStatus::PENDING && status != PipelineStageStatus::DISPATCHED;
}

bool isValidStageId(const std::string& stage_id) {
    return !stage_id.empty() &&
           stage_id.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-") ==
               std::string::npos;
}

std::vector<std::string> validateWorkflow(const WorkflowDefinition& workflow) {
    std::vector<std::string> errors;

    if (workflow.stages.empty()) {
        errors.push_back("workflow has no stages");
        return errors;
    }

    std::set<std::string> stage_ids;
    std::set<std::string> upload_names;
    std::vector<std::string> aggregate_ids;

    for (const auto& stage : workflow.stages) {
        const std::string where = "stage " + stage.id;
        if (!isValidStageId(stage.id)) {
            errors.push_back("invalid stage id '" + stage.id + "'");
        }
        if (!stage_ids.insert(stage.id).second) {
            errors.push_back("duplicate stage id '" + stage.id + "'");
        }

        if (stage.kind == StageKind::AGGREGATE) {
            aggregate_ids.push_back(stage.id);
            if (!stage.steps.empty()) {
                errors.push_back(where + ": an aggregate stage has no steps");
            }
            if (stage.needs.empty()) {
                errors.push_back(where + ": an aggregate stage needs at least one stage");
            }
            if (stage.suite) {
                errors.push_back(where + ": an aggregate stage cannot be a fan-out");
            }
        }

        std::set<std::string> step_ids;
        for (const auto& step : stage.steps) {
            const std::string step_where = "step " + stage.id + "/" + step.id;
            if (!isValidStageId(step.id)) {
                errors.push_back(where + ": invalid step id '" + step.id + "'");
            }
            if (!step_ids.insert(step.id).second) {
                errors.push_back(where + ": duplicate step id '" + step.id + "'");
            }

            if (step.kind == StepKind::COMMAND) {
                if (step.run.empty()) {
                    errors.push_back(step_where + ": a command step needs 'run'");
                }
            } else if (!step.artifact) {
                errors.push_back(step_where + ": an artifact step needs 'artifact'");
            } else {
                checkPlaceholders(step.artifact->name, step_where, errors);
                checkPlaceholders(step.artifact->path, step_where, errors);
                if (step.artifact->retention_days && *step.artifact->retention_days <= 0) {
                    errors.push_back(step_where + ": retention must be at least one day");
                }
                bool literal_name = WorkflowUtils::findPlaceholders(step.artifact->name).empty();
                if (literal_name && !ArtifactStore::isValidName(step.artifact->name)) {
                    errors.push_back(step_where + ": invalid artifact name '" + step.artifact->name + "'");
                }
                if (literal_name && step.kind == StepKind::UPLOAD_ARTIFACT &&
                    !upload_names.insert(step.artifact->name).second) {
                    errors.push_back(step_where + ": artifact '" + step.artifact->name +
                                     "' is uploaded by more than one step");
                }
            }

            checkPlaceholders(step.run, step_where, errors);
            for (const auto& [name, value] : step.env) {
                checkPlaceholders(value, step_where + " env " + name, errors);
            }
            for (const auto& clause : step.condition.any_of) {
                if (clause.kind == ConditionClause::Kind::INPUT_FLAG &&
                    clause.value != "unit-tests" && clause.value != "upload") {
                    errors.push_back(step_where + ": unknown input flag '" + clause.value + "'");
                }
            }
            if (step.timeout && step.timeout->count() <= 0) {
                errors.push_back(step_where + ": timeout must be positive");
            }
        }
    }

    if (aggregate_ids.size() > 1) {
        errors.push_back("workflow has more than one aggregate stage");
    }

    PipelineDependencyResolver resolver(workflow.stages);
    for (const auto& missing : resolver.getMissingDependencies()) {
        errors.push_back("unknown dependency " + missing);
    }

    std::vector<std::string> cycle = resolver.getCircularDependencies();
    if (!cycle.empty()) {
        std::string path;
        for (const auto& id : cycle) {
            path += (path.empty() ? "" : " -> ") + id;
        }
        errors.push_back("circular dependency: " + path);
    }

    for (const auto& aggregate_id : aggregate_ids) {
        if (!resolver.getDependents(aggregate_id).empty()) {
            errors.push_back("aggregate stage " + aggregate_id + " must not be needed by other stages");
        }
    }

    return errors;
}

std::string formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    std::ostringstream oss;
    auto total_seconds = ms / 1000;
    if (total_seconds < 60) {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(ms) / 1000.0 << "s";
        return oss.str();
    }

    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds % 3600) / 60;
    auto seconds = total_seconds % 60;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m ";
    } else {
        oss << minutes << "m ";
    }
    oss << std::setw(2) << std::setfill('0') << seconds << "s";
    return oss.str();
}

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string eventTypeToString(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::RUN_STARTED: return "run_started";
        case PipelineEventType::STAGE_DISPATCHED: return "stage_dispatched";
        case PipelineEventType::STAGE_SKIPPED: return "stage_skipped";
        case PipelineEventType::STAGE_COMPLETED: return "stage_completed";
        case PipelineEventType::STEP_STARTED: return "step_started";
        case PipelineEventType::STEP_COMPLETED: return "step_completed";
        case PipelineEventType::RUN_CANCELLED: return "run_cancelled";
        case PipelineEventType::RUN_COMPLETED: return "run_completed";
        default: return "unknown";
    }
}

WorkflowDefinition parseWorkflowYAML(const std::string& content) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw WorkflowError("invalid workflow YAML: " + std::string(e.what()));
    }

    if (!root.IsMap()) {
        throw WorkflowError("a workflow document must be a map");
    }

    WorkflowDefinition workflow;
    try {
        workflow.name = readScalar(root, "name", "workflow", false, "workflow");
        workflow.push_branches = readStringList(root, "push-branches", "workflow");

        YAML::Node stages = root["stages"];
        if (!stages || !stages.IsSequence()) {
            throw WorkflowError("workflow: 'stages' must be a list");
        }
        for (const auto& stage : stages) {
            workflow.stages.push_back(parseStage(stage));
        }
    } catch (const YAML::Exception& e) {
        throw WorkflowError("invalid workflow: " + std::string(e.what()));
    }

    return workflow;
}

WorkflowDefinition loadWorkflowFromYAML(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        throw WorkflowError("cannot open workflow file " + filepath);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    WorkflowDefinition workflow = parseWorkflowYAML(buffer.str());
    LOG_INFO("pipeline_engine", "Loaded workflow " + workflow.name + " from " + filepath);
    return workflow;
}

std::string workflowToYAML(const WorkflowDefinition& workflow) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << workflow.name;
    out << YAML::Key << "push-branches" << YAML::Value << YAML::Flow << workflow.push_branches;

    out << YAML::Key << "stages" << YAML::Value << YAML::BeginSeq;
    for (const auto& stage : workflow.stages) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << stage.id;
        out << YAML::Key << "name" << YAML::Value << stage.name;
        if (stage.kind != StageKind::STEPS) {
            out << YAML::Key << "kind" << YAML::Value << WorkflowUtils::stageKindToString(stage.kind);
        }
        if (!stage.needs.empty()) {
            out << YAML::Key << "needs" << YAML::Value << YAML::Flow << stage.needs;
        }
        if (stage.suite) {
            out << YAML::Key << "suite" << YAML::Value << WorkflowUtils::suiteToString(*stage.suite);
        }
        if (!stage.working_directory.empty()) {
            out << YAML::Key << "working-directory" << YAML::Value << stage.working_directory;
        }

        if (!stage.steps.empty()) {
            out << YAML::Key << "steps" << YAML::Value << YAML::BeginSeq;
            for (const auto& step : stage.steps) {
                out << YAML::BeginMap;
                out << YAML::Key << "id" << YAML::Value << step.id;
                out << YAML::Key << "name" << YAML::Value << step.name;
                if (step.kind != StepKind::COMMAND) {
                    out << YAML::Key << "kind" << YAML::Value << WorkflowUtils::stepKindToString(step.kind);
                }
                if (!step.run.empty()) {
                    out << YAML::Key << "run" << YAML::Value << step.run;
                }
                if (!step.condition.empty()) {
                    out << YAML::Key << "if" << YAML::Value << YAML::BeginSeq;
                    for (const auto& clause : step.condition.any_of) {
                        out << YAML::Flow << YAML::BeginMap
                            << YAML::Key << WorkflowUtils::clauseKindToString(clause.kind)
                            << YAML::Value << YAML::DoubleQuoted << clause.value
                            << YAML::EndMap;
                    }
                    out << YAML::EndSeq;
                }
                if (step.always) {
                    out << YAML::Key << "always" << YAML::Value << true;
                }
                if (!step.env.empty()) {
                    out << YAML::Key << "env" << YAML::Value << YAML::BeginMap;
                    for (const auto& [name, value] : step.env) {
                        out << YAML::Key << name << YAML::Value << value;
                    }
                    out << YAML::EndMap;
                }
                if (!step.secrets.empty()) {
                    out << YAML::Key << "secrets" << YAML::Value << YAML::Flow << step.secrets;
                }
                if (step.artifact) {
                    out << YAML::Key << "artifact" << YAML::Value << YAML::BeginMap;
                    out << YAML::Key << "name" << YAML::Value << step.artifact->name;
                    out << YAML::Key << "path" << YAML::Value << step.artifact->path;
                    if (step.artifact->retention_days) {
                        out << YAML::Key << "retention-days" << YAML::Value << *step.artifact->retention_days;
                    }
                    out << YAML::EndMap;
                }
                if (step.timeout) {
                    out << YAML::Key << "timeout-minutes" << YAML::Value
                        << static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(*step.timeout).count());
                }
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

bool saveWorkflowToYAML(const std::string& filepath, const WorkflowDefinition& workflow) {
    std::ofstream file(filepath);
    if (!file) {
        LOG_ERROR("pipeline_engine", "Cannot write workflow file " + filepath);
        return false;
    }
    file << workflowToYAML(workflow);
    return static_cast<bool>(file);
}

nlohmann::json inputsToJson(const RunInputs& inputs) {
    nlohmann::json json;
    json["trigger"] = RunInputsUtils::triggerToString(inputs.trigger);
    json["branch"] = inputs.branch;
    json["wpt"] = RunInputsUtils::wptModeToString(inputs.wpt);
    json["layout"] = RunInputsUtils::layoutToString(inputs.layout);
    json["unit_tests"] = inputs.unit_tests;
    json["upload"] = inputs.upload;
    json["release_id"] = inputs.release_id ? nlohmann::json(*inputs.release_id) : nlohmann::json(nullptr);
    json["run_id"] = inputs.run_id;
    json["repository_owner"] = inputs.repository_owner;
    return json;
}

nlohmann::json runResultToJson(const PipelineRunResult& result) {
    nlohmann::json json;
    json["run_id"] = result.run_id;
    json["workflow"] = result.workflow_name;
    if (result.inputs) {
        json["inputs"] = inputsToJson(*result.inputs);
    }
    json["cancelled"] = result.cancelled;
    json["start_time"] = formatTimestamp(result.start_time);
    json["end_time"] = formatTimestamp(result.end_time);
    json["duration_ms"] = result.duration.count();
    json["execution_order"] = result.execution_order;

    json["stages"] = nlohmann::json::object();
    for (const auto& [stage_id, stage] : result.stages) {
        nlohmann::json entry;
        entry["status"] = statusToString(stage.status);
        entry["duration_ms"] = stage.execution_time.count();
        if (!stage.error_message.empty()) {
            entry["error"] = stage.error_message;
        }
        if (!stage.parameters.empty()) {
            entry["parameters"] = stage.parameters;
        }
        entry["steps"] = nlohmann::json::array();
        for (const auto& step : stage.steps) {
            entry["steps"].push_back(stepResultToJson(step));
        }
        json["stages"][stage_id] = entry;
    }

    json["artifacts"] = nlohmann::json::array();
    for (const auto& manifest : result.artifacts) {
        json["artifacts"].push_back(manifest.toJson());
    }

    nlohmann::json aggregate;
    aggregate["stage"] = result.aggregate_stage;
    aggregate["success"] = result.aggregate.success;
    aggregate["exit_code"] = result.aggregate.exitCode();
    aggregate["failing_stages"] = result.aggregate.failing_stages;
    aggregate["observed"] = nlohmann::json::object();
    for (const auto& [stage_id, status] : result.aggregate.observed) {
        aggregate["observed"][stage_id] = statusToString(status);
    }
    json["result"] = aggregate;

    return json;
}

nlohmann::json planToJson(const RunInputs& inputs, const std::vector<PlannedStage>& plan) {
    nlohmann::json json;
    json["inputs"] = inputsToJson(inputs);
    json["stages"] = nlohmann::json::array();
    for (const auto& stage : plan) {
        nlohmann::json entry;
        entry["id"] = stage.stage_id;
        entry["name"] = stage.name;
        entry["kind"] = WorkflowUtils::stageKindToString(stage.kind);
        entry["dispatched"] = stage.dispatched;
        entry["reason"] = stage.reason;
        entry["needs"] = stage.needs;
        entry["parameters"] = stage.parameters;
        entry["steps"] = stage.steps;
        json["stages"].push_back(entry);
    }
    return json;
}

bool saveRunReport(const std::string& filepath, const PipelineRunResult& result) {
    std::ofstream file(filepath);
    if (!file) {
        LOG_ERROR("pipeline_engine", "Cannot write run report " + filepath);
        return false;
    }
    file << runResultToJson(result).dump(2) << '\n';
    return static_cast<bool>(file);
}

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace CIP
