// EN: cipctl - runs the build, conformance fan-out and result aggregation pipeline
// FR: cipctl - exécute le pipeline de build, de fan-out de conformité et d'agrégation des résultats

#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/artifact_store.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/result_aggregator.hpp"
#include "orchestrator/run_inputs.hpp"

using namespace CIP;
using namespace CIP::Orchestrator;

namespace {

constexpr int kExitUsage = 2;
constexpr const char* kDefaultConfigFile = "config/cipctl.yaml";

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

std::vector<ConfigManager::ValidationRule> settingsRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule max_parallel;
    max_parallel.key = "engine.max_parallel_stages";
    max_parallel.type = "int";
    max_parallel.min_value = 1;
    max_parallel.max_value = 64;
    rules.push_back(max_parallel);

    ConfigManager::ValidationRule timeout;
    timeout.key = "engine.timeout_minutes";
    timeout.type = "int";
    timeout.min_value = 0;
    rules.push_back(timeout);

    ConfigManager::ValidationRule grace;
    grace.key = "engine.kill_grace_seconds";
    grace.type = "int";
    grace.min_value = 0;
    rules.push_back(grace);

    ConfigManager::ValidationRule retention;
    retention.key = "artifacts.retention_days";
    retention.type = "int";
    retention.min_value = 1;
    rules.push_back(retention);

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "error"};
    rules.push_back(level);

    return rules;
}

std::string setting(const ConfigManager& config, const std::string& path, const std::string& fallback = "") {
    ConfigValue value = config.getPath(path);
    return value.isValid() ? value.rawText() : fallback;
}

// EN: Settings file, then CIP_* environment, then command-line options
// FR: Fichier de paramètres, puis environnement CIP_*, puis options de ligne de commande
void loadSettings(const CLI::CliParseResult& parsed, ConfigManager& config) {
    auto explicit_file = parsed.overrides.find("cli.config");
    if (explicit_file != parsed.overrides.end()) {
        const std::string path = explicit_file->second.rawText();
        if (!config.loadFromFile(path)) {
            throw UsageError("cannot load settings file " + path);
        }
    } else if (std::filesystem::exists(kDefaultConfigFile)) {
        if (!config.loadFromFile(kDefaultConfigFile)) {
            throw UsageError(std::string("cannot load settings file ") + kDefaultConfigFile);
        }
    }

    size_t from_env = config.loadEnvironmentOverrides("CIP_");
    size_t from_cli = CLI::CliParser::applyOverrides(parsed, config);
    LOG_DEBUG("cipctl", "Applied " + std::to_string(from_env) + " environment and " +
              std::to_string(from_cli) + " command-line overrides");

    config.addValidationRules(settingsRules());
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string message = "invalid settings:";
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw UsageError(message);
    }
}

void configureLogging(const ConfigManager& config) {
    Logger& logger = Logger::getInstance();
    auto level = Logger::parseLevel(setting(config, "logging.level", "info"));
    if (!level) {
        throw UsageError("unknown log level " + setting(config, "logging.level"));
    }
    logger.setLogLevel(*level);

    const std::string file = setting(config, "logging.file");
    if (!file.empty()) {
        logger.setOutputFile(file);
    }
}

WorkflowDefinition loadWorkflow(const ConfigManager& config) {
    const std::string path = setting(config, "paths.workflow");
    if (path.empty()) {
        return WorkflowDefinition::linuxDefault();
    }
    return PipelineUtils::loadWorkflowFromYAML(path);
}

void printSummary(const PipelineRunResult& result) {
    std::cout << "Run " << result.run_id << " (" << result.workflow_name << ")"
              << (result.cancelled ? " cancelled" : "") << "\n";
    for (const auto& stage_id : result.execution_order) {
        auto it = result.stages.find(stage_id);
        if (it == result.stages.end()) {
            continue;
        }
        const PipelineStageResult& stage = it->second;
        std::cout << "  " << stage_id << ": " << PipelineUtils::statusToString(stage.status);
        if (stage.execution_time.count() > 0) {
            std::cout << " (" << PipelineUtils::formatDuration(stage.execution_time) << ")";
        }
        if (!stage.error_message.empty()) {
            std::cout << " - " << stage.error_message;
        }
        std::cout << "\n";
    }
    for (const auto& artifact : result.artifacts) {
        std::cout << "  artifact " << artifact.name << ": " << artifact.files.size() << " files, "
                  << artifact.total_size << " bytes\n";
    }
    std::cout << "Result: " << (result.isSuccess() ? "success" : "failure") << "\n";
}

int commandRun(const ConfigManager& config) {
    RunInputs inputs = RunInputs::fromConfig(config);
    WorkflowDefinition workflow = loadWorkflow(config);

    std::vector<std::string> errors = inputs.validate(workflow.push_branches);
    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "cipctl: " << error << "\n";
        }
        return kExitUsage;
    }

    Logger& logger = Logger::getInstance();
    inputs.run_id = logger.generateCorrelationId();
    logger.setCorrelationId(inputs.run_id);

    PipelineEngine engine(PipelineEngine::configFrom(config));
    engine.registerEventCallback([](const PipelineEvent& event) {
        if (event.type == PipelineEventType::STAGE_DISPATCHED || event.type == PipelineEventType::STAGE_SKIPPED ||
            event.type == PipelineEventType::STAGE_COMPLETED) {
            LOG_DEBUG("cipctl", PipelineUtils::eventTypeToString(event.type) + " " + event.stage_id + " " +
                      PipelineUtils::statusToString(event.status));
        }
    });

    SignalHandler& signals = SignalHandler::getInstance();
    signals.initialize();

    auto future = engine.executeAsync(workflow, std::make_shared<const RunInputs>(inputs));
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (signals.isShutdownRequested() && !engine.isCancelled()) {
            LOG_WARN("cipctl", "Signal " + std::to_string(signals.lastSignal()) + " received, cancelling the run");
            engine.cancel();
        }
    }
    PipelineRunResult result = future.get();
    signals.restore();

    const std::string report = setting(config, "paths.report");
    if (!report.empty() && !PipelineUtils::saveRunReport(report, result)) {
        std::cerr << "cipctl: cannot write report " << report << "\n";
    }

    printSummary(result);
    return result.exitCode();
}

int commandPlan(const ConfigManager& config) {
    RunInputs inputs = RunInputs::fromConfig(config);
    WorkflowDefinition workflow = loadWorkflow(config);

    std::vector<std::string> errors = inputs.validate(workflow.push_branches);
    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "cipctl: " << error << "\n";
        }
        return kExitUsage;
    }

    PipelineEngine engine(PipelineEngine::configFrom(config));
    std::cout << PipelineUtils::planToJson(inputs, engine.plan(workflow, inputs)).dump(2) << "\n";
    return 0;
}

int commandAggregate(const std::vector<std::string>& operands) {
    if (operands.empty()) {
        throw UsageError("aggregate needs at least one STAGE=STATUS operand");
    }

    std::map<std::string, PipelineStageStatus> statuses;
    for (const auto& operand : operands) {
        auto eq = operand.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw UsageError("expected STAGE=STATUS, got '" + operand + "'");
        }
        auto status = PipelineUtils::parseStatus(operand.substr(eq + 1));
        if (!status) {
            throw UsageError("unknown status in '" + operand + "'");
        }
        statuses[operand.substr(0, eq)] = *status;
    }

    AggregateResult result;
    try {
        result = ResultAggregator::reduce(statuses);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }

    nlohmann::json json;
    json["success"] = result.success;
    json["exit_code"] = result.exitCode();
    json["failing_stages"] = result.failing_stages;
    std::cout << json.dump() << "\n";
    return result.exitCode();
}

int commandArtifacts(const ConfigManager& config, const std::vector<std::string>& operands) {
    const std::string action = operands.empty() ? "list" : operands.front();
    PipelineEngine::Config engine_config = PipelineEngine::configFrom(config);
    ArtifactStore store(engine_config.artifact_dir, engine_config.artifact_retention_days);

    if (action == "list") {
        std::vector<std::string> runs;
        const std::string run_id = setting(config, "artifacts.run_id");
        if (run_id.empty()) {
            runs = store.listRuns();
        } else {
            runs.push_back(run_id);
        }

        nlohmann::json json = nlohmann::json::array();
        for (const auto& run : runs) {
            for (const auto& manifest : store.list(run)) {
                json.push_back(manifest.toJson());
            }
        }
        std::cout << json.dump(2) << "\n";
        return 0;
    }

    if (action == "prune") {
        size_t removed = store.pruneExpired(std::chrono::system_clock::now());
        std::cout << "Pruned " << removed << " expired artifact" << (removed == 1 ? "" : "s") << "\n";
        return 0;
    }

    throw UsageError("unknown artifacts action '" + action + "' (expected list or prune)");
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::CliParser parser("cipctl");
    parser.addStandardOptions();

    CLI::CliParseResult parsed = parser.parse(argc, argv);
    switch (parsed.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            std::cout << parsed.help_text;
            return 0;
        case CLI::CliParseStatus::VERSION_REQUESTED:
            std::cout << parsed.version_text;
            return 0;
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            for (const auto& error : parsed.errors) {
                std::cerr << "cipctl: " << error << "\n";
            }
            std::cerr << "Try 'cipctl --help' for more information.\n";
            return kExitUsage;
    }

    ConfigManager& config = ConfigManager::getInstance();

    try {
        loadSettings(parsed, config);
        configureLogging(config);

        if (parsed.command == "run") {
            return commandRun(config);
        }
        if (parsed.command == "plan") {
            return commandPlan(config);
        }
        if (parsed.command == "aggregate") {
            return commandAggregate(parsed.operands);
        }
        if (parsed.command == "artifacts") {
            return commandArtifacts(config, parsed.operands);
        }
        throw UsageError("unknown command '" + parsed.command + "'");
    } catch (const UsageError& e) {
        std::cerr << "cipctl: " << e.what() << "\n";
        return kExitUsage;
    } catch (const InputError& e) {
        LOG_ERROR("cipctl", std::string("Invalid run inputs: ") + e.what());
        std::cerr << "cipctl: " << e.what() << "\n";
        return kExitUsage;
    } catch (const WorkflowError& e) {
        LOG_ERROR("cipctl", std::string("Invalid workflow: ") + e.what());
        std::cerr << "cipctl: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        LOG_ERROR("cipctl", std::string("Fatal error: ") + e.what());
        std::cerr << "cipctl: " << e.what() << "\n";
        return kExitUsage;
    }
}
