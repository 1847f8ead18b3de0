// EN: Stage driver - sequential step execution with fail-fast, always-run steps and per-step logs
// FR: Driver d'étape - exécution séquentielle des steps avec fail-fast, steps always et logs par step

#include "orchestrator/stage_driver.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CIP {
namespace Orchestrator {

std::optional<std::string> EnvironmentSecretProvider::getSecret(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

StageDriver::StageDriver(StageDriverConfig config, ArtifactStore& store,
                         std::shared_ptr<const SecretProvider> secrets)
    : config_(std::move(config)),
      store_(store),
      secrets_(secrets ? std::move(secrets) : std::make_shared<EnvironmentSecretProvider>()),
      runner_(config_.poll_interval) {
}

WorkflowUtils::PlaceholderValues StageDriver::placeholderValues(const RunInputs& inputs,
                                                                const std::optional<DispatchParameters>& dispatch) {
    WorkflowUtils::PlaceholderValues values;
    values["wpt"] = RunInputsUtils::wptModeToString(inputs.wpt);
    values["layout"] = RunInputsUtils::layoutToString(inputs.layout);
    values["branch"] = inputs.branch;
    values["release_id"] = inputs.release_id.value_or("");
    values["run_id"] = inputs.run_id;
    values["repository_owner"] = inputs.repository_owner;

    if (dispatch) {
        values["wpt"] = dispatch->wpt;
        values["layout"] = dispatch->layout;
    }
    return values;
}

std::string StageDriver::logFileName(size_t index, const std::string& step_id) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << index << '-' << step_id << ".log";
    return oss.str();
}

PipelineStageResult StageDriver::run(const PipelineStageConfig& stage, const RunInputs& inputs,
                                     const WorkflowUtils::PlaceholderValues& values,
                                     const CancelPredicate& is_cancelled,
                                     const StepObserver& observer) const {
    if (stage.kind != StageKind::STEPS) {
        throw std::invalid_argument("stage '" + stage.id + "' has no steps to drive");
    }

    PipelineStageResult result;
    result.stage_id = stage.id;
    result.start_time = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();

    bool failed = false;
    bool cancelled = false;

    auto notify = [&](const StepResult& step, bool starting) {
        if (observer) {
            observer(stage.id, step, starting);
        }
    };

    for (size_t i = 0; i < stage.steps.size(); ++i) {
        const PipelineStepConfig& step = stage.steps[i];

        if (!failed && !cancelled && is_cancelled && is_cancelled()) {
            cancelled = true;
            LOG_WARN("stage_driver", "Cancellation requested during stage " + stage.id);
        }

        StepResult step_result;
        step_result.step_id = step.id;
        step_result.name = step.name;

        if ((failed || cancelled) && !step.always) {
            step_result.status = failed ? PipelineStageStatus::SKIPPED : PipelineStageStatus::CANCELLED;
            step_result.error_message = failed ? "skipped after an earlier failure" : "run cancelled";
            result.steps.push_back(step_result);
            notify(step_result, false);
            continue;
        }

        if (!step.condition.evaluate(inputs)) {
            step_result.status = PipelineStageStatus::SKIPPED;
            step_result.error_message = "condition not met: " + step.condition.toString();
            LOG_DEBUG("stage_driver", "Skipping " + stage.id + "/" + step.id + " (" + step_result.error_message + ")");
            result.steps.push_back(step_result);
            notify(step_result, false);
            continue;
        }

        notify(step_result, true);

        // EN: Always-run steps keep running through a cancellation.
        // FR: Les steps always continuent malgré une annulation.
        step_result = runStep(stage, step, i + 1, inputs, values, step.always ? CancelPredicate{} : is_cancelled);

        if (step_result.status == PipelineStageStatus::CANCELLED && !failed) {
            cancelled = true;
        } else if (step_result.status == PipelineStageStatus::FAILURE && !cancelled) {
            if (!failed) {
                result.error_message = step.id + ": " + step_result.error_message;
            }
            failed = true;
        }

        result.steps.push_back(step_result);
        notify(step_result, false);
    }

    if (cancelled) {
        result.status = PipelineStageStatus::CANCELLED;
        if (result.error_message.empty()) {
            result.error_message = "run cancelled";
        }
    } else if (failed) {
        result.status = PipelineStageStatus::FAILURE;
    } else {
        result.status = PipelineStageStatus::SUCCESS;
    }

    result.end_time = std::chrono::system_clock::now();
    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

StepResult StageDriver::runStep(const PipelineStageConfig& stage, const PipelineStepConfig& step, size_t index,
                                const RunInputs& inputs, const WorkflowUtils::PlaceholderValues& values,
                                const CancelPredicate& is_cancelled) const {
    StepResult result;
    result.step_id = step.id;
    result.name = step.name;
    result.log_path = (config_.log_dir / inputs.run_id / stage.id / logFileName(index, step.id)).string();

    auto started = std::chrono::steady_clock::now();
    fs::path working_directory = config_.workspace / stage.working_directory;

    LOG_INFO_META("stage_driver", "Running step " + step.name,
                  (std::unordered_map<std::string, std::string>{
                      {"stage", stage.id},
                      {"step", step.id},
                      {"kind", WorkflowUtils::stepKindToString(step.kind)}}));

    try {
        std::error_code ec;
        fs::create_directories(working_directory, ec);
        if (ec) {
            throw ProcessError("cannot create working directory " + working_directory.string() + ": " + ec.message());
        }

        if (step.kind == StepKind::COMMAND) {
            runCommand(step, working_directory, values, is_cancelled, result);
        } else {
            runArtifactStep(stage, step, working_directory, inputs, values, result);
        }
    } catch (const ArtifactError& e) {
        result.status = PipelineStageStatus::FAILURE;
        result.exit_code = 1;
        result.error_message = e.what();
    } catch (const ProcessError& e) {
        result.status = PipelineStageStatus::FAILURE;
        result.exit_code = 1;
        result.error_message = e.what();
    } catch (const WorkflowError& e) {
        result.status = PipelineStageStatus::FAILURE;
        result.exit_code = 1;
        result.error_message = e.what();
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    std::unordered_map<std::string, std::string> metadata = {
        {"stage", stage.id},
        {"step", step.id},
        {"status", PipelineUtils::statusToString(result.status)},
        {"exit_code", std::to_string(result.exit_code)},
        {"duration_ms", std::to_string(result.duration.count())},
        {"log", result.log_path}
    };
    if (result.status == PipelineStageStatus::SUCCESS) {
        LOG_INFO_META("stage_driver", "Step succeeded", metadata);
    } else {
        metadata["error"] = result.error_message;
        LOG_ERROR_META("stage_driver", "Step did not succeed", metadata);
    }
    return result;
}

void StageDriver::runCommand(const PipelineStepConfig& step, const fs::path& working_directory,
                             const WorkflowUtils::PlaceholderValues& values, const CancelPredicate& is_cancelled,
                             StepResult& result) const {
    ProcessSpec spec;
    spec.command = WorkflowUtils::expandPlaceholders(step.run, values);
    spec.working_directory = working_directory;
    spec.log_path = result.log_path;
    spec.kill_grace = config_.kill_grace;
    if (step.timeout) {
        spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*step.timeout);
    }

    for (const auto& [name, value] : step.env) {
        spec.environment.emplace_back(name, WorkflowUtils::expandPlaceholders(value, values));
    }
    for (const auto& name : step.secrets) {
        auto secret = secrets_->getSecret(name);
        if (!secret) {
            result.status = PipelineStageStatus::FAILURE;
            result.exit_code = 1;
            result.error_message = "secret " + name + " is not available";
            return;
        }
        spec.environment.emplace_back(name, *secret);
    }

    ProcessResult process = runner_.run(spec, is_cancelled);
    result.exit_code = process.exit_code;

    switch (process.outcome) {
        case ProcessOutcome::EXITED:
            if (process.exit_code == 0) {
                result.status = PipelineStageStatus::SUCCESS;
            } else {
                result.status = PipelineStageStatus::FAILURE;
                result.error_message = "exited with code " + std::to_string(process.exit_code);
            }
            break;
        case ProcessOutcome::SIGNALED:
            result.status = PipelineStageStatus::FAILURE;
            result.error_message = "killed by signal " + std::to_string(process.term_signal);
            break;
        case ProcessOutcome::TIMED_OUT:
            result.status = PipelineStageStatus::FAILURE;
            result.error_message = "timed out";
            break;
        case ProcessOutcome::CANCELLED:
            result.status = PipelineStageStatus::CANCELLED;
            result.error_message = "run cancelled";
            break;
    }
}

void StageDriver::runArtifactStep(const PipelineStageConfig& stage, const PipelineStepConfig& step,
                                  const fs::path& working_directory, const RunInputs& inputs,
                                  const WorkflowUtils::PlaceholderValues& values, StepResult& result) const {
    if (!step.artifact) {
        throw ArtifactError("step '" + step.id + "' has no artifact");
    }

    const std::string name = WorkflowUtils::expandPlaceholders(step.artifact->name, values);
    const std::string path = WorkflowUtils::expandPlaceholders(step.artifact->path, values);

    fs::path log_path(result.log_path);
    std::error_code ec;
    fs::create_directories(log_path.parent_path(), ec);
    std::ofstream log(log_path, std::ios::trunc);

    if (step.kind == StepKind::UPLOAD_ARTIFACT) {
        ArtifactManifest manifest = store_.upload(inputs.run_id, name, stage.id, working_directory, path,
                                                  step.artifact->retention_days);
        log << "uploaded artifact " << name << " (" << manifest.files.size() << " files, "
            << manifest.total_size << " bytes, retention " << manifest.retention_days << " days)\n";
        for (const auto& file : manifest.files) {
            log << "  " << file.path << " " << file.size << "\n";
        }
    } else {
        std::vector<fs::path> restored = store_.download(inputs.run_id, name, working_directory / path);
        log << "downloaded artifact " << name << " (" << restored.size() << " files)\n";
        for (const auto& file : restored) {
            log << "  " << file.string() << "\n";
        }
    }

    result.status = PipelineStageStatus::SUCCESS;
    result.exit_code = 0;
}

} // namespace Orchestrator
} // namespace CIP
