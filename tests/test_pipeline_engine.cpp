#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "orchestrator/pipeline_engine.hpp"

using namespace CIP;
using namespace CIP::Orchestrator;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

// EN: Test fixture for PipelineEngine tests
// FR: Fixture de test pour les tests de PipelineEngine
class PipelineEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        // EN: Create test directory
        // FR: Créer le répertoire de test
        test_dir = fs::temp_directory_path() / "cip_pipeline_engine_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "workspace");

        config.max_parallel_stages = 2;
        config.workspace = test_dir / "workspace";
        config.artifact_dir = test_dir / "artifacts";
        config.log_dir = test_dir / "logs";
        config.kill_grace = 500ms;
        config.poll_interval = 10ms;

        engine = std::make_unique<PipelineEngine>(config);
    }

    void TearDown() override {
        engine.reset();

        // EN: Cleanup test directory
        // FR: Nettoyer le répertoire de test
        fs::remove_all(test_dir);
    }

    static PipelineStepConfig command(const std::string& id, const std::string& run) {
        PipelineStepConfig step;
        step.id = id;
        step.name = id;
        step.run = run;
        return step;
    }

    static PipelineStageConfig conformanceStage(const std::string& id, ConformanceSuite suite) {
        PipelineStageConfig stage;
        stage.id = id;
        stage.name = id;
        stage.suite = suite;
        stage.needs = {"build"};
        stage.working_directory = id;
        stage.steps.push_back(command("run-wpt", "echo \"${{ wpt }} ${{ layout }}\" > params.txt"));
        return stage;
    }

    // EN: Helper building the build, two fan-outs and aggregate shape with a configurable build command
    // FR: Assistant construisant la forme build, deux fan-outs et agrégat avec une commande de build configurable
    static WorkflowDefinition createWorkflow(const std::string& build_command = "true") {
        WorkflowDefinition workflow;
        workflow.name = "test-linux";
        workflow.push_branches = {"try-linux", "try-wpt", "try-wpt-2020"};

        PipelineStageConfig build;
        build.id = "build";
        build.name = "Build";
        build.steps.push_back(command("compile", build_command));
        workflow.stages.push_back(build);

        workflow.stages.push_back(conformanceStage("wpt-2020", ConformanceSuite::LAYOUT_2020));
        workflow.stages.push_back(conformanceStage("wpt-2013", ConformanceSuite::LAYOUT_2013));

        PipelineStageConfig result;
        result.id = "result";
        result.name = "Result";
        result.kind = StageKind::AGGREGATE;
        result.needs = {"build", "wpt-2020", "wpt-2013"};
        workflow.stages.push_back(result);
        return workflow;
    }

    static RunInputsPtr dispatchInputs(LayoutSelector layout, WptMode wpt = WptMode::TEST) {
        auto inputs = std::make_shared<RunInputs>();
        inputs->layout = layout;
        inputs->wpt = wpt;
        inputs->run_id = "run-1";
        return inputs;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return content;
    }

    fs::path test_dir;
    PipelineEngine::Config config;
    std::unique_ptr<PipelineEngine> engine;
};

TEST_F(PipelineEngineTest, ConstructionValidatesConfig) {
    PipelineEngine::Config bad = config;
    bad.max_parallel_stages = 0;
    EXPECT_THROW({ PipelineEngine broken(bad); }, std::invalid_argument);

    bad = config;
    bad.artifact_retention_days = 0;
    EXPECT_THROW({ PipelineEngine broken(bad); }, std::invalid_argument);

    EXPECT_EQ(engine->getConfig().max_parallel_stages, 2u);
    EXPECT_EQ(engine->getDispatcher().rules().size(), 2u);
    EXPECT_EQ(engine->getArtifactStore().root(), test_dir / "artifacts");
}

// EN: A failed build skips both fan-outs and fails the run
// FR: Un build en échec ignore les deux fan-outs et fait échouer l'exécution
TEST_F(PipelineEngineTest, BuildFailureSkipsFanouts) {
    PipelineRunResult result = engine->execute(createWorkflow("exit 1"), dispatchInputs(LayoutSelector::ALL));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.exitCode(), 1);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.statusOf("build"), PipelineStageStatus::FAILURE);
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::SKIPPED);
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::SKIPPED);
    EXPECT_EQ(result.statusOf("result"), PipelineStageStatus::FAILURE);

    EXPECT_EQ(result.stages.at("wpt-2020").error_message, "dependency build is failure");
    EXPECT_EQ(result.stages.at("result").error_message, "failing stages: build");
    EXPECT_EQ(result.aggregate.failing_stages, (std::vector<std::string>{"build"}));
    EXPECT_EQ(result.aggregate_stage, "result");
    EXPECT_EQ(result.stages.at("build").error_message, "compile: exited with code 1");
}

TEST_F(PipelineEngineTest, NoLayoutRequestedSucceeds) {
    PipelineRunResult result = engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::NONE));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.exitCode(), 0);
    EXPECT_EQ(result.statusOf("build"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::SKIPPED);
    EXPECT_EQ(result.stages.at("wpt-2020").error_message, "suite layout-2020 not selected");
    EXPECT_EQ(result.statusOf("result"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.execution_order, (std::vector<std::string>{"build", "wpt-2020", "wpt-2013", "result"}));
}

// EN: Only the selected suite runs, with its fixed layout tag and the run's wpt mode
// FR: Seule la suite sélectionnée s'exécute, avec son tag de layout fixe et le mode wpt de l'exécution
TEST_F(PipelineEngineTest, SelectedSuiteReceivesParameters) {
    PipelineRunResult result = engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::LAYOUT_2020));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::SKIPPED);

    const auto& parameters = result.stages.at("wpt-2020").parameters;
    EXPECT_EQ(parameters.at("wpt"), "test");
    EXPECT_EQ(parameters.at("layout"), "layout-2020");
    EXPECT_EQ(readFile(config.workspace / "wpt-2020" / "params.txt"), "test layout-2020\n");
    EXPECT_FALSE(fs::exists(config.workspace / "wpt-2013" / "params.txt"));
}

TEST_F(PipelineEngineTest, AllLayoutsRunBothSuites) {
    PipelineRunResult result =
        engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::ALL, WptMode::SYNC));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(readFile(config.workspace / "wpt-2020" / "params.txt"), "sync layout-2020\n");
    EXPECT_EQ(readFile(config.workspace / "wpt-2013" / "params.txt"), "sync layout-2013\n");
    EXPECT_EQ(result.aggregate.observed.size(), 3u);
}

TEST_F(PipelineEngineTest, PushToTryBranchSelectsSuite) {
    auto inputs = std::make_shared<RunInputs>();
    inputs->trigger = TriggerKind::BRANCH_PUSH;
    inputs->branch = "try-wpt";

    PipelineRunResult result = engine->execute(createWorkflow(), inputs);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::SKIPPED);

    // EN: A run id is generated when none is given
    // FR: Un id d'exécution est généré quand aucun n'est fourni
    EXPECT_FALSE(result.run_id.empty());
    EXPECT_EQ(result.inputs->run_id, result.run_id);
    EXPECT_TRUE(fs::exists(config.log_dir / result.run_id / "build" / "01-compile.log"));
}

TEST_F(PipelineEngineTest, FailedFanoutFailsTheRun) {
    WorkflowDefinition workflow = createWorkflow();
    workflow.stages[2].steps.push_back(command("check", "exit 2"));

    PipelineRunResult result = engine->execute(workflow, dispatchInputs(LayoutSelector::ALL));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::FAILURE);
    EXPECT_EQ(result.aggregate.failing_stages, (std::vector<std::string>{"wpt-2013"}));
}

// EN: Cancelling while the build runs stops it and cancels the stages not yet dispatched
// FR: Annuler pendant le build l'arrête et annule les étapes pas encore dispatchées
TEST_F(PipelineEngineTest, CancellationDuringBuild) {
    engine->registerEventCallback([this](const PipelineEvent& event) {
        if (event.type == PipelineEventType::STAGE_DISPATCHED && event.stage_id == "build") {
            engine->cancel();
        }
    });

    auto start = std::chrono::steady_clock::now();
    PipelineRunResult result = engine->execute(createWorkflow("sleep 30"), dispatchInputs(LayoutSelector::ALL));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(engine->isCancelled());
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.statusOf("build"), PipelineStageStatus::CANCELLED);
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::CANCELLED);
    EXPECT_EQ(result.stages.at("wpt-2020").error_message, "run cancelled before dispatch");
    EXPECT_EQ(result.statusOf("result"), PipelineStageStatus::FAILURE);
    EXPECT_LT(elapsed, 15s);

    // EN: The next run starts with a clear cancellation flag
    // FR: L'exécution suivante démarre avec un drapeau d'annulation remis à zéro
    engine->unregisterEventCallback();
    PipelineRunResult next = engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::NONE));
    EXPECT_TRUE(next.isSuccess());
    EXPECT_FALSE(next.cancelled);
}

// EN: A cancelled fan-out fails the run even though the build succeeded
// FR: Un fan-out annulé fait échouer l'exécution même si le build a réussi
TEST_F(PipelineEngineTest, CancelledFanoutFailsRun) {
    engine->registerEventCallback([this](const PipelineEvent& event) {
        if (event.type == PipelineEventType::STAGE_DISPATCHED && event.stage_id == "wpt-2020") {
            engine->cancel();
        }
    });

    WorkflowDefinition workflow = createWorkflow();
    workflow.stages[1].steps[0].run = "sleep 30";

    auto start = std::chrono::steady_clock::now();
    PipelineRunResult result = engine->execute(workflow, dispatchInputs(LayoutSelector::ALL));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.statusOf("build"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(result.statusOf("wpt-2020"), PipelineStageStatus::CANCELLED);
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::CANCELLED);
    EXPECT_EQ(result.stages.at("wpt-2013").error_message, "run cancelled before dispatch");
    EXPECT_EQ(result.statusOf("result"), PipelineStageStatus::FAILURE);
    EXPECT_EQ(result.aggregate.failing_stages, (std::vector<std::string>{"wpt-2013", "wpt-2020"}));
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.exitCode(), 1);
    EXPECT_LT(elapsed, 15s);
}

TEST_F(PipelineEngineTest, GlobalTimeoutCancelsRun) {
    PipelineEngine::Config timed = config;
    timed.global_timeout = std::chrono::seconds(1);
    PipelineEngine timed_engine(timed);

    PipelineRunResult result = timed_engine.execute(createWorkflow("sleep 30"), dispatchInputs(LayoutSelector::NONE));

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.statusOf("build"), PipelineStageStatus::CANCELLED);
    EXPECT_EQ(result.exitCode(), 1);
}

TEST_F(PipelineEngineTest, EventsAreEmittedInOrder) {
    std::mutex events_mutex;
    std::vector<PipelineEvent> events;
    engine->registerEventCallback([&events_mutex, &events](const PipelineEvent& event) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event);
    });

    engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::LAYOUT_2013));

    std::lock_guard<std::mutex> lock(events_mutex);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().type, PipelineEventType::RUN_STARTED);
    EXPECT_EQ(events.back().type, PipelineEventType::RUN_COMPLETED);
    EXPECT_EQ(events.back().status, PipelineStageStatus::SUCCESS);

    auto skipped = std::find_if(events.begin(), events.end(), [](const PipelineEvent& event) {
        return event.type == PipelineEventType::STAGE_SKIPPED;
    });
    ASSERT_NE(skipped, events.end());
    EXPECT_EQ(skipped->stage_id, "wpt-2020");

    bool step_started = std::any_of(events.begin(), events.end(), [](const PipelineEvent& event) {
        return event.type == PipelineEventType::STEP_STARTED && event.stage_id == "wpt-2013" &&
               event.step_id == "run-wpt";
    });
    EXPECT_TRUE(step_started);
    EXPECT_TRUE(std::all_of(events.begin(), events.end(),
                            [](const PipelineEvent& event) { return event.run_id == "run-1"; }));
}

// EN: Artifacts produced by the build are visible to the fan-outs and listed in the result
// FR: Les artefacts produits par le build sont visibles des fan-outs et listés dans le résultat
TEST_F(PipelineEngineTest, ArtifactsFlowFromBuildToFanout) {
    WorkflowDefinition workflow = createWorkflow("echo payload > target.tar.gz");

    PipelineStepConfig upload;
    upload.id = "archive-binary";
    upload.kind = StepKind::UPLOAD_ARTIFACT;
    upload.artifact = ArtifactSpec{"release-binary", "target.tar.gz", std::nullopt};
    workflow.stages[0].steps.push_back(upload);

    PipelineStepConfig download;
    download.id = "download-binary";
    download.kind = StepKind::DOWNLOAD_ARTIFACT;
    download.artifact = ArtifactSpec{"release-binary", ".", std::nullopt};
    auto& steps = workflow.stages[1].steps;
    steps.insert(steps.begin(), download);
    steps.push_back(command("check", "test -f target.tar.gz"));

    PipelineRunResult result = engine->execute(workflow, dispatchInputs(LayoutSelector::LAYOUT_2020));

    EXPECT_TRUE(result.isSuccess()) << result.stages.at("wpt-2020").error_message;
    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].name, "release-binary");
    EXPECT_EQ(result.artifacts[0].producer, "build");
}

TEST_F(PipelineEngineTest, InvalidWorkflowIsRejected) {
    WorkflowDefinition workflow = createWorkflow();
    workflow.stages[0].needs = {"wpt-2020"};

    EXPECT_FALSE(engine->validate(workflow).is_valid);
    EXPECT_THROW(engine->execute(workflow, dispatchInputs(LayoutSelector::NONE)), WorkflowError);
    EXPECT_THROW(engine->plan(workflow, RunInputs{}), WorkflowError);
}

TEST_F(PipelineEngineTest, InvalidInputsAreRejected) {
    EXPECT_THROW(engine->execute(createWorkflow(), nullptr), InputError);

    auto push = std::make_shared<RunInputs>();
    push->trigger = TriggerKind::BRANCH_PUSH;
    push->branch = "main";
    EXPECT_THROW(engine->execute(createWorkflow(), push), InputError);

    // EN: A release id is only accepted from a calling pipeline
    // FR: Un id de release n'est accepté que d'un pipeline appelant
    auto release = std::make_shared<RunInputs>();
    release->run_id = "run-1";
    release->release_id = std::string("v1");
    EXPECT_THROW(engine->execute(createWorkflow(), release), InputError);

    EXPECT_FALSE(fs::exists(config.log_dir / "run-1"));
}

TEST_F(PipelineEngineTest, ValidationWarnings) {
    WorkflowDefinition workflow = createWorkflow();
    workflow.stages.pop_back();
    workflow.push_branches.clear();

    auto validation = engine->validate(workflow);
    EXPECT_TRUE(validation.is_valid);
    EXPECT_EQ(validation.warnings.size(), 2u);

    FanoutDispatcher only2020({FanoutDispatcher::defaultRules().front()});
    PipelineEngine limited(config, nullptr, only2020);
    auto limited_validation = limited.validate(createWorkflow());
    EXPECT_FALSE(limited_validation.is_valid);
    ASSERT_EQ(limited_validation.errors.size(), 1u);
    EXPECT_NE(limited_validation.errors[0].find("no dispatch rule for suite layout-2013"), std::string::npos);
}

// EN: Without an aggregate stage every stage counts towards the result
// FR: Sans étape d'agrégation chaque étape compte pour le résultat
TEST_F(PipelineEngineTest, WorkflowWithoutAggregate) {
    WorkflowDefinition workflow = createWorkflow("exit 1");
    workflow.stages.pop_back();

    PipelineRunResult result = engine->execute(workflow, dispatchInputs(LayoutSelector::NONE));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_TRUE(result.aggregate_stage.empty());
    EXPECT_EQ(result.aggregate.failing_stages, (std::vector<std::string>{"build"}));
    EXPECT_EQ(result.aggregate.observed.size(), 3u);
}

TEST_F(PipelineEngineTest, AsyncExecution) {
    auto future = engine->executeAsync(createWorkflow(), dispatchInputs(LayoutSelector::LAYOUT_2013));
    ASSERT_EQ(future.wait_for(30s), std::future_status::ready);

    PipelineRunResult result = future.get();
    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.statusOf("wpt-2013"), PipelineStageStatus::SUCCESS);
}

TEST_F(PipelineEngineTest, PlanDescribesDispatch) {
    WorkflowDefinition workflow = createWorkflow();
    PipelineStepConfig unit = command("unit-tests", "true");
    unit.condition = StepCondition::inputFlag("unit-tests");
    workflow.stages[0].steps.push_back(unit);

    RunInputs inputs;
    inputs.layout = LayoutSelector::LAYOUT_2020;
    inputs.wpt = WptMode::SYNC;

    std::vector<PlannedStage> plan = engine->plan(workflow, inputs);
    ASSERT_EQ(plan.size(), 4u);

    EXPECT_EQ(plan[0].stage_id, "build");
    EXPECT_TRUE(plan[0].dispatched);
    EXPECT_EQ(plan[0].reason, "unconditional");
    EXPECT_EQ(plan[0].steps, (std::vector<std::string>{"compile"}));

    EXPECT_TRUE(plan[1].dispatched);
    EXPECT_EQ(plan[1].reason, "suite layout-2020 selected");
    EXPECT_EQ(plan[1].parameters.at("wpt"), "sync");
    EXPECT_EQ(plan[1].parameters.at("layout"), "layout-2020");

    EXPECT_FALSE(plan[2].dispatched);
    EXPECT_EQ(plan[2].reason, "suite layout-2013 not selected");

    EXPECT_EQ(plan[3].kind, StageKind::AGGREGATE);
    EXPECT_EQ(plan[3].reason, "aggregates build, wpt-2020, wpt-2013");

    // EN: Planning runs nothing
    // FR: La planification n'exécute rien
    EXPECT_FALSE(fs::exists(config.log_dir));

    nlohmann::json json = PipelineUtils::planToJson(inputs, plan);
    EXPECT_EQ(json["inputs"]["layout"], "2020");
    EXPECT_EQ(json["stages"].size(), 4u);
    EXPECT_EQ(json["stages"][2]["dispatched"], false);
}

TEST_F(PipelineEngineTest, ConfigFromSettings) {
    auto& settings = ConfigManager::getInstance();
    settings.reset();
    ASSERT_TRUE(settings.loadFromString(
        "paths:\n"
        "  workspace: /src/servo\n"
        "  artifact_dir: /var/cip/artifacts\n"
        "engine:\n"
        "  max_parallel_stages: 3\n"
        "  timeout_minutes: 120\n"
        "  kill_grace_seconds: 2\n"
        "artifacts:\n"
        "  retention_days: 7\n"));

    PipelineEngine::Config loaded = PipelineEngine::configFrom(settings);
    EXPECT_EQ(loaded.workspace, fs::path("/src/servo"));
    EXPECT_EQ(loaded.artifact_dir, fs::path("/var/cip/artifacts"));
    EXPECT_EQ(loaded.log_dir, fs::path("logs"));
    EXPECT_EQ(loaded.max_parallel_stages, 3u);
    EXPECT_EQ(loaded.global_timeout, std::chrono::minutes(120));
    EXPECT_EQ(loaded.kill_grace, std::chrono::seconds(2));
    EXPECT_EQ(loaded.artifact_retention_days, 7);

    settings.setPath("engine.max_parallel_stages", ConfigValue(0));
    EXPECT_THROW(PipelineEngine::configFrom(settings), std::invalid_argument);
    settings.reset();
}

TEST_F(PipelineEngineTest, RunReport) {
    PipelineRunResult result = engine->execute(createWorkflow(), dispatchInputs(LayoutSelector::LAYOUT_2020));

    nlohmann::json json = PipelineUtils::runResultToJson(result);
    EXPECT_EQ(json["run_id"], "run-1");
    EXPECT_EQ(json["workflow"], "test-linux");
    EXPECT_EQ(json["inputs"]["layout"], "2020");
    EXPECT_EQ(json["stages"]["wpt-2020"]["status"], "success");
    EXPECT_EQ(json["stages"]["wpt-2020"]["parameters"]["layout"], "layout-2020");
    EXPECT_EQ(json["stages"]["wpt-2013"]["error"], "suite layout-2013 not selected");
    EXPECT_EQ(json["stages"]["build"]["steps"][0]["id"], "compile");
    EXPECT_EQ(json["result"]["exit_code"], 0);
    EXPECT_EQ(json["result"]["observed"]["wpt-2013"], "skipped");

    fs::path report = test_dir / "report.json";
    ASSERT_TRUE(PipelineUtils::saveRunReport(report.string(), result));
    std::ifstream in(report);
    nlohmann::json reloaded = nlohmann::json::parse(in);
    EXPECT_EQ(reloaded["result"]["success"], true);
}

// EN: Test fixture for PipelineDependencyResolver tests
// FR: Fixture de test pour les tests de PipelineDependencyResolver
class PipelineDependencyResolverTest : public ::testing::Test {
protected:
    static PipelineStageConfig stage(const std::string& id, const std::vector<std::string>& needs = {}) {
        PipelineStageConfig config;
        config.id = id;
        config.needs = needs;
        return config;
    }
};

TEST_F(PipelineDependencyResolverTest, DependencyResolution) {
    PipelineDependencyResolver resolver({
        stage("build"),
        stage("wpt-2020", {"build"}),
        stage("wpt-2013", {"build"}),
        stage("result", {"build", "wpt-2020", "wpt-2013"})});

    EXPECT_FALSE(resolver.hasCircularDependency());
    EXPECT_TRUE(resolver.getMissingDependencies().empty());

    auto levels = resolver.getExecutionLevels();
    ASSERT_EQ(levels.size(), 3u);
    EXPECT_EQ(levels[0], (std::vector<std::string>{"build"}));
    EXPECT_EQ(levels[1], (std::vector<std::string>{"wpt-2020", "wpt-2013"}));
    EXPECT_EQ(levels[2], (std::vector<std::string>{"result"}));

    EXPECT_EQ(resolver.getExecutionOrder(), (std::vector<std::string>{"build", "wpt-2020", "wpt-2013", "result"}));
    EXPECT_EQ(resolver.getDependents("build"), (std::vector<std::string>{"wpt-2020", "wpt-2013", "result"}));
    EXPECT_EQ(resolver.getDependencies("result").size(), 3u);

    EXPECT_TRUE(resolver.canExecute("wpt-2020", {"build"}));
    EXPECT_FALSE(resolver.canExecute("result", {"build", "wpt-2020"}));
    EXPECT_FALSE(resolver.canExecute("unknown", {}));
}

TEST_F(PipelineDependencyResolverTest, CircularDependencyDetection) {
    PipelineDependencyResolver resolver({stage("a", {"b"}), stage("b", {"a"}), stage("c")});

    EXPECT_TRUE(resolver.hasCircularDependency());
    EXPECT_EQ(resolver.getCircularDependencies(), (std::vector<std::string>{"a", "b", "a"}));
    EXPECT_THROW(resolver.getExecutionOrder(), WorkflowError);
    EXPECT_THROW(resolver.getExecutionLevels(), WorkflowError);
}

TEST_F(PipelineDependencyResolverTest, MissingDependencies) {
    PipelineDependencyResolver resolver({stage("build", {"checkout"}), stage("result", {"build"})});

    EXPECT_EQ(resolver.getMissingDependencies(), (std::vector<std::string>{"build -> checkout"}));
    EXPECT_EQ(resolver.getExecutionOrder(), (std::vector<std::string>{"build", "result"}));
}

// EN: Test fixture for PipelineExecutionContext tests
// FR: Fixture de test pour les tests de PipelineExecutionContext
class PipelineExecutionContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto inputs = std::make_shared<RunInputs>();
        inputs->branch = "try-wpt";
        context = std::make_unique<PipelineExecutionContext>("run-42", inputs);
    }

    std::unique_ptr<PipelineExecutionContext> context;
};

TEST_F(PipelineExecutionContextTest, StageResultManagement) {
    EXPECT_EQ(context->getRunId(), "run-42");
    EXPECT_EQ(context->getInputs().branch, "try-wpt");
    EXPECT_EQ(context->getStageStatus("build"), PipelineStageStatus::PENDING);
    EXPECT_FALSE(context->getStageResult("build").has_value());

    PipelineStageResult build;
    build.stage_id = "build";
    build.status = PipelineStageStatus::SUCCESS;
    context->updateStageResult(build);

    EXPECT_EQ(context->getStageStatus("build"), PipelineStageStatus::SUCCESS);
    ASSERT_TRUE(context->getStageResult("build").has_value());
    EXPECT_EQ(context->getAllStageResults().size(), 1u);
}

TEST_F(PipelineExecutionContextTest, Cancellation) {
    EXPECT_FALSE(context->isCancelled());
    context->requestCancellation();
    EXPECT_TRUE(context->isCancelled());
}

TEST_F(PipelineExecutionContextTest, EventHandling) {
    std::vector<PipelineEvent> events;
    context->setEventCallback([&events](const PipelineEvent& event) { events.push_back(event); });

    context->emitEvent(PipelineEventType::STAGE_SKIPPED, "wpt-2020", "", PipelineStageStatus::SKIPPED,
                       "suite layout-2020 not selected");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].run_id, "run-42");
    EXPECT_EQ(events[0].stage_id, "wpt-2020");
    EXPECT_EQ(events[0].message, "suite layout-2020 not selected");

    // EN: A throwing callback does not escape
    // FR: Un callback qui lance ne s'échappe pas
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
    context->setEventCallback([](const PipelineEvent&) { throw std::runtime_error("observer failed"); });
    EXPECT_NO_THROW(context->emitEvent(PipelineEventType::RUN_STARTED));
}

// EN: Test fixture for PipelineUtils tests
// FR: Fixture de test pour les tests de PipelineUtils
class PipelineUtilsTest : public ::testing::Test {};

TEST_F(PipelineUtilsTest, StatusUtilities) {
    EXPECT_EQ(PipelineUtils::statusToString(PipelineStageStatus::SKIPPED), "skipped");
    EXPECT_EQ(PipelineUtils::parseStatus("Success"), PipelineStageStatus::SUCCESS);
    EXPECT_EQ(PipelineUtils::parseStatus("CANCELLED"), PipelineStageStatus::CANCELLED);
    EXPECT_FALSE(PipelineUtils::parseStatus("done").has_value());

    EXPECT_TRUE(PipelineUtils::isTerminal(PipelineStageStatus::SKIPPED));
    EXPECT_FALSE(PipelineUtils::isTerminal(PipelineStageStatus::DISPATCHED));
}

TEST_F(PipelineUtilsTest, ValidationUtilities) {
    EXPECT_TRUE(PipelineUtils::isValidStageId("wpt-2020"));
    EXPECT_TRUE(PipelineUtils::isValidStageId("build_linux"));
    EXPECT_FALSE(PipelineUtils::isValidStageId(""));
    EXPECT_FALSE(PipelineUtils::isValidStageId("wpt 2020"));
    EXPECT_FALSE(PipelineUtils::isValidStageId("a/b"));
}

TEST_F(PipelineUtilsTest, FormatUtilities) {
    EXPECT_EQ(PipelineUtils::formatDuration(std::chrono::milliseconds(500)), "500ms");
    EXPECT_EQ(PipelineUtils::formatDuration(std::chrono::milliseconds(1500)), "1.5s");
    EXPECT_EQ(PipelineUtils::formatDuration(std::chrono::milliseconds(125000)), "2m 05s");
    EXPECT_EQ(PipelineUtils::formatDuration(std::chrono::milliseconds(3725000)), "1h 02m 05s");

    auto timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    EXPECT_EQ(PipelineUtils::formatTimestamp(timestamp), "2023-11-14T22:13:20Z");

    EXPECT_EQ(PipelineUtils::eventTypeToString(PipelineEventType::STAGE_SKIPPED), "stage_skipped");
    EXPECT_EQ(PipelineUtils::eventTypeToString(PipelineEventType::RUN_CANCELLED), "run_cancelled");
}

TEST_F(PipelineUtilsTest, InputsToJson) {
    RunInputs inputs;
    inputs.trigger = TriggerKind::REUSABLE_CALL;
    inputs.release_id = std::string("v2");
    inputs.unit_tests = true;

    nlohmann::json json = PipelineUtils::inputsToJson(inputs);
    EXPECT_EQ(json["trigger"], "call");
    EXPECT_EQ(json["release_id"], "v2");
    EXPECT_EQ(json["unit_tests"], true);
    EXPECT_EQ(json["layout"], "none");

    inputs.release_id.reset();
    EXPECT_TRUE(PipelineUtils::inputsToJson(inputs)["release_id"].is_null());
}
