// EN: Workflow definition types, step conditions, placeholders and the built-in Linux workflow
// FR: Types de définition de workflow, conditions de step, placeholders et workflow Linux intégré

#include "orchestrator/workflow_definition.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace CIP {
namespace Orchestrator {

namespace {

const std::regex& placeholderRegex() {
    static const std::regex pattern(R"(\$\{\{\s*([A-Za-z_][A-Za-z0-9_-]*)\s*\}\})");
    return pattern;
}

PipelineStepConfig commandStep(const std::string& id, const std::string& name, const std::string& run) {
    PipelineStepConfig step;
    step.id = id;
    step.name = name;
    step.kind = StepKind::COMMAND;
    step.run = run;
    return step;
}

PipelineStepConfig artifactStep(StepKind kind, const std::string& id, const std::string& name,
                                const std::string& artifact_name, const std::string& path) {
    PipelineStepConfig step;
    step.id = id;
    step.name = name;
    step.kind = kind;
    step.artifact = ArtifactSpec{artifact_name, path, std::nullopt};
    return step;
}

PipelineStageConfig conformanceStage(const std::string& id, const std::string& name, ConformanceSuite suite) {
    PipelineStageConfig stage;
    stage.id = id;
    stage.name = name;
    stage.suite = suite;
    stage.needs = {"build"};

    const std::string logs = "wpt-logs-" + WorkflowUtils::suiteToString(suite);

    stage.steps.push_back(artifactStep(StepKind::DOWNLOAD_ARTIFACT, "download-binary",
                                       "Download release binary", "release-binary", "."));
    stage.steps.push_back(commandStep("unpack-binary", "Unpack release binary", "tar -xzf target.tar.gz"));

    PipelineStepConfig test = commandStep("run-wpt", "Run web platform tests",
        "python3 ./mach test-wpt --release --${{ layout }} --log-raw test-wpt.log");
    test.condition.any_of.push_back({ConditionClause::Kind::WPT_EQUALS, "test"});
    stage.steps.push_back(test);

    PipelineStepConfig sync = commandStep("run-wpt-sync", "Run web platform tests for expectation sync",
        "python3 ./mach test-wpt --release --${{ layout }} --always-succeed --log-raw test-wpt.log");
    sync.condition.any_of.push_back({ConditionClause::Kind::WPT_EQUALS, "sync"});
    stage.steps.push_back(sync);

    PipelineStepConfig update = commandStep("update-expectations", "Update test expectations",
        "python3 ./mach update-wpt --${{ layout }} test-wpt.log");
    update.condition.any_of.push_back({ConditionClause::Kind::WPT_EQUALS, "sync"});
    stage.steps.push_back(update);

    PipelineStepConfig archive = artifactStep(StepKind::UPLOAD_ARTIFACT, "archive-logs",
                                              "Archive test logs", logs, "test-wpt.log");
    archive.always = true;
    stage.steps.push_back(archive);

    return stage;
}

} // namespace

bool ConditionClause::evaluate(const RunInputs& inputs) const {
    switch (kind) {
        case Kind::INPUT_FLAG:
            if (value == "unit-tests") return inputs.unit_tests;
            if (value == "upload") return inputs.upload;
            return false;
        case Kind::BRANCH_EQUALS:
            return inputs.branch == value;
        case Kind::LAYOUT_EQUALS:
            return RunInputsUtils::layoutToString(inputs.layout) == value;
        case Kind::WPT_EQUALS:
            return RunInputsUtils::wptModeToString(inputs.wpt) == value;
    }
    return false;
}

std::string ConditionClause::toString() const {
    return WorkflowUtils::clauseKindToString(kind) + "==" + value;
}

bool StepCondition::evaluate(const RunInputs& inputs) const {
    if (any_of.empty()) {
        return true;
    }
    return std::any_of(any_of.begin(), any_of.end(),
                       [&inputs](const ConditionClause& clause) { return clause.evaluate(inputs); });
}

std::string StepCondition::toString() const {
    if (any_of.empty()) {
        return "always";
    }
    std::string text;
    for (const auto& clause : any_of) {
        text += (text.empty() ? "" : " || ") + clause.toString();
    }
    return text;
}

StepCondition StepCondition::inputFlag(const std::string& flag) {
    StepCondition condition;
    condition.any_of.push_back({ConditionClause::Kind::INPUT_FLAG, flag});
    return condition;
}

StepCondition& StepCondition::orBranch(const std::string& branch) {
    any_of.push_back({ConditionClause::Kind::BRANCH_EQUALS, branch});
    return *this;
}

const PipelineStageConfig* WorkflowDefinition::findStage(const std::string& id) const {
    auto it = std::find_if(stages.begin(), stages.end(),
                           [&id](const PipelineStageConfig& stage) { return stage.id == id; });
    return it != stages.end() ? &*it : nullptr;
}

WorkflowDefinition WorkflowDefinition::linuxDefault() {
    WorkflowDefinition workflow;
    workflow.name = "linux";
    workflow.push_branches = {"try-linux", "try-wpt", "try-wpt-2020"};

    PipelineStageConfig build;
    build.id = "build";
    build.name = "Linux Build";

    build.steps.push_back(commandStep("bootstrap-python", "Bootstrap Python",
                                      "python3 -m pip install --upgrade pip virtualenv"));
    build.steps.push_back(commandStep("bootstrap", "Bootstrap",
                                      "sudo apt update && python3 ./mach bootstrap"));
    build.steps.push_back(commandStep("tidy", "Tidy", "python3 ./mach test-tidy --no-progress --all"));
    build.steps.push_back(commandStep("release-build", "Release build", "python3 ./mach build --release"));
    build.steps.push_back(commandStep("smoketest", "Smoketest", "xvfb-run python3 ./mach smoketest"));
    build.steps.push_back(commandStep("script-tests", "Script tests", "./mach test-scripts"));

    PipelineStepConfig unit = commandStep("unit-tests", "Unit tests", "python3 ./mach test-unit --release");
    unit.condition = StepCondition::inputFlag("unit-tests");
    unit.condition.orBranch("try-linux");
    build.steps.push_back(unit);

    build.steps.push_back(commandStep("rename-build-timing", "Rename build timing",
                                      "cp -r target/cargo-timings target/cargo-timings-linux"));

    PipelineStepConfig timings = artifactStep(StepKind::UPLOAD_ARTIFACT, "archive-build-timing",
                                              "Archive build timing", "cargo-timings", "target/cargo-timings-*");
    timings.always = true;
    build.steps.push_back(timings);

    build.steps.push_back(commandStep("lockfile-check", "Lockfile check", "./etc/ci/lockfile_changed.sh"));
    build.steps.push_back(commandStep("package", "Package", "python3 ./mach package --release"));
    build.steps.push_back(artifactStep(StepKind::UPLOAD_ARTIFACT, "upload-package", "Upload package",
                                       "linux", "target/release/servo-tech-demo.tar.gz"));

    PipelineStepConfig nightly = commandStep("upload-nightly", "Upload nightly",
        "python3 ./mach upload-nightly linux --secret-from-environment --github-release-id ${{ release_id }}");
    nightly.condition = StepCondition::inputFlag("upload");
    nightly.secrets = {"S3_UPLOAD_CREDENTIALS", "NIGHTLY_REPO_TOKEN"};
    nightly.env.emplace_back("NIGHTLY_REPO", "${{ repository_owner }}/servo-nightly-builds");
    build.steps.push_back(nightly);

    build.steps.push_back(commandStep("package-binary", "Package binary",
                                      "tar -czf target.tar.gz target/release/servo resources"));
    build.steps.push_back(artifactStep(StepKind::UPLOAD_ARTIFACT, "archive-binary", "Archive binary",
                                       "release-binary", "target.tar.gz"));

    workflow.stages.push_back(build);
    workflow.stages.push_back(conformanceStage("wpt-2020", "Linux WPT Tests 2020", ConformanceSuite::LAYOUT_2020));
    workflow.stages.push_back(conformanceStage("wpt-2013", "Linux WPT Tests 2013", ConformanceSuite::LAYOUT_2013));

    PipelineStageConfig result;
    result.id = "result";
    result.name = "Result";
    result.kind = StageKind::AGGREGATE;
    result.needs = {"build", "wpt-2020", "wpt-2013"};
    workflow.stages.push_back(result);

    return workflow;
}

namespace WorkflowUtils {

std::string suiteToString(ConformanceSuite suite) {
    switch (suite) {
        case ConformanceSuite::LAYOUT_2020: return "layout-2020";
        case ConformanceSuite::LAYOUT_2013: return "layout-2013";
        default: return "unknown";
    }
}

std::optional<ConformanceSuite> parseSuite(const std::string& text) {
    if (text == "layout-2020" || text == "2020") return ConformanceSuite::LAYOUT_2020;
    if (text == "layout-2013" || text == "2013") return ConformanceSuite::LAYOUT_2013;
    return std::nullopt;
}

std::string stageKindToString(StageKind kind) {
    return kind == StageKind::AGGREGATE ? "aggregate" : "steps";
}

std::optional<StageKind> parseStageKind(const std::string& text) {
    if (text == "steps") return StageKind::STEPS;
    if (text == "aggregate") return StageKind::AGGREGATE;
    return std::nullopt;
}

std::string stepKindToString(StepKind kind) {
    switch (kind) {
        case StepKind::COMMAND: return "command";
        case StepKind::UPLOAD_ARTIFACT: return "upload-artifact";
        case StepKind::DOWNLOAD_ARTIFACT: return "download-artifact";
        default: return "unknown";
    }
}

std::optional<StepKind> parseStepKind(const std::string& text) {
    if (text == "command") return StepKind::COMMAND;
    if (text == "upload-artifact") return StepKind::UPLOAD_ARTIFACT;
    if (text == "download-artifact") return StepKind::DOWNLOAD_ARTIFACT;
    return std::nullopt;
}

std::string clauseKindToString(ConditionClause::Kind kind) {
    switch (kind) {
        case ConditionClause::Kind::INPUT_FLAG: return "input";
        case ConditionClause::Kind::BRANCH_EQUALS: return "branch";
        case ConditionClause::Kind::LAYOUT_EQUALS: return "layout";
        case ConditionClause::Kind::WPT_EQUALS: return "wpt";
        default: return "unknown";
    }
}

std::optional<ConditionClause::Kind> parseClauseKind(const std::string& text) {
    if (text == "input") return ConditionClause::Kind::INPUT_FLAG;
    if (text == "branch") return ConditionClause::Kind::BRANCH_EQUALS;
    if (text == "layout") return ConditionClause::Kind::LAYOUT_EQUALS;
    if (text == "wpt") return ConditionClause::Kind::WPT_EQUALS;
    return std::nullopt;
}

const std::set<std::string>& knownPlaceholders() {
    static const std::set<std::string> names = {
        "wpt", "layout", "branch", "release_id", "run_id", "repository_owner"
    };
    return names;
}

std::vector<std::string> findPlaceholders(const std::string& text) {
    std::vector<std::string> names;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholderRegex());
         it != std::sregex_iterator(); ++it) {
        names.push_back((*it)[1].str());
    }
    return names;
}

std::string expandPlaceholders(const std::string& text, const PlaceholderValues& values) {
    std::string result;
    size_t last = 0;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholderRegex());
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        auto value = values.find(match[1].str());
        if (value == values.end()) {
            throw WorkflowError("unknown placeholder '" + match[1].str() + "'");
        }
        result.append(text, last, static_cast<size_t>(match.position()) - last);
        result += value->second;
        last = static_cast<size_t>(match.position() + match.length());
    }

    result.append(text, last, std::string::npos);
    return result;
}

} // namespace WorkflowUtils

} // namespace Orchestrator
} // namespace CIP
