/**
 * @file test_pipeline.cpp
 * @brief Tests for phase assembly and ordered phase execution
 */

#include <optiframe/io/LogService.hpp>
#include <optiframe/pipeline/Pipeline.hpp>

#include <testing/ChainTasks.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace optiframe {
namespace {

using namespace fixtures;

/// Validation task failing on negative input
class CheckA : public Task<void> {
  public:
    static constexpr std::string_view kName = "CheckA";
    using Dependencies = Deps<A>;

    explicit CheckA(const A &a) : a_(a) {}

    void Execute() override { OPTIFRAME_REQUIRE(a_.value >= 0, "A must not be negative"); }

  private:
    const A &a_;
};

class PipelineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        GetLogService().ClearSinks();
        GetLogService().Clear();
    }

    void TearDown() override { GetLogService().Clear(); }

    /// Task recording its name when run
    TaskDescriptor Recording(const std::string &name) {
        return TaskDescriptor::FromFunction<void>(name, [this, name] { order_.push_back(name); });
    }

    std::vector<std::string> order_;
};

// =============================================================================
// Assembly
// =============================================================================

TEST(PhaseTest, NamesAndOrder) {
    EXPECT_STREQ(PhaseName(Phase::Validate), "validation");
    EXPECT_STREQ(PhaseName(Phase::PreProcess), "pre_processing");
    EXPECT_STREQ(PhaseName(Phase::Build), "build");
    EXPECT_STREQ(PhaseName(Phase::Solve), "solving");
    EXPECT_STREQ(PhaseName(Phase::Extract), "solution_extraction");

    for (std::size_t i = 0; i < kNumPhases; ++i) {
        EXPECT_EQ(PhaseIndex(kPhaseOrder[i]), i);
        EXPECT_EQ(FindPhase(PhaseName(kPhaseOrder[i])), kPhaseOrder[i]);
    }
    EXPECT_FALSE(FindPhase("post_processing").has_value());
}

TEST(ModuleTest, TasksGroupedByPhase) {
    Module module("chain");
    module.Add<Phase::Build, ProduceB>()
        .Add<Phase::Build, ProduceC>()
        .Add<Phase::Validate, CheckA>();
    EXPECT_EQ(module.Name(), "chain");
    EXPECT_EQ(module.NumTasks(), 3u);
    EXPECT_EQ(module.TasksFor(Phase::Build).size(), 2u);
    EXPECT_EQ(module.TasksFor(Phase::Validate)[0].Name(), "CheckA");
    EXPECT_TRUE(module.TasksFor(Phase::Solve).empty());
}

TEST_F(PipelineTest, OneStepPerPhase) {
    Pipeline pipeline("demo");
    Workflow workflow = pipeline.BuildWorkflow();
    EXPECT_EQ(workflow.Name(), "demo");
    ASSERT_EQ(workflow.NumSteps(), kNumPhases);
    for (std::size_t i = 0; i < kNumPhases; ++i) {
        EXPECT_EQ(workflow.StepAt(i).Name(), PhaseName(kPhaseOrder[i]));
        EXPECT_EQ(workflow.StepAt(i).NumTasks(), 0u);
    }
}

TEST_F(PipelineTest, BoundaryTasksBeforeModuleTasks) {
    Module first("first");
    first.Add(Phase::Solve, Recording("first.solve"));
    Module second("second");
    second.Add(Phase::Solve, Recording("second.solve"));

    Pipeline pipeline("ordered");
    pipeline.AddModules(std::move(first), std::move(second));
    pipeline.AddPhaseTask(Phase::Solve, Recording("boundary.solve"));

    const Workflow workflow = pipeline.BuildWorkflow();
    const Step *solve = workflow.FindStep("solving");
    ASSERT_NE(solve, nullptr);
    EXPECT_EQ(solve->TaskNames(),
              (std::vector<std::string>{"boundary.solve", "first.solve", "second.solve"}));

    auto run = pipeline.Initialize();
    run.Run();
    EXPECT_EQ(order_,
              (std::vector<std::string>{"boundary.solve", "first.solve", "second.solve"}));
}

TEST_F(PipelineTest, OptionsAppliedToEveryPhase) {
    Pipeline pipeline("parallel", StepOptions::Parallel(2));
    const Workflow workflow = pipeline.BuildWorkflow();
    for (const auto &step : workflow.Steps()) {
        EXPECT_EQ(step.Options().execution, ExecutionMode::Parallel);
    }
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(PipelineTest, SettingsSeeded) {
    Pipeline pipeline("named");
    auto run = pipeline.Initialize(A{1});
    EXPECT_EQ(run.GetRegistry().Require<PipelineSettings>().name, "named");
    EXPECT_EQ(run.GetRegistry().Require<A>().value, 1);
}

TEST_F(PipelineTest, PhasesRunInOrder) {
    Pipeline pipeline("phases");
    for (Phase phase : kPhaseOrder) {
        pipeline.AddPhaseTask(phase, Recording(PhaseName(phase)));
    }

    auto run = pipeline.Initialize();
    EXPECT_EQ(run.NextPhase(), Phase::Validate);
    run.Run();

    EXPECT_TRUE(run.IsComplete());
    EXPECT_FALSE(run.NextPhase().has_value());
    EXPECT_EQ(order_, (std::vector<std::string>{"validation", "pre_processing", "build",
                                                "solving", "solution_extraction"}));
    EXPECT_EQ(run.CompletedPhases().size(), kNumPhases);
    EXPECT_EQ(run.GetWorkflow().Reports().size(), kNumPhases);
}

TEST_F(PipelineTest, CannotSkipPhase) {
    Pipeline pipeline("strict");
    auto run = pipeline.Initialize();
    try {
        run.RunPhase(Phase::Build);
        FAIL() << "expected LifecycleError";
    } catch (const LifecycleError &e) {
        EXPECT_NE(std::string(e.what()).find("cannot run phase 'build' before 'validation'"),
                  std::string::npos);
    }
    EXPECT_TRUE(run.CompletedPhases().empty());
}

TEST_F(PipelineTest, CannotRepeatPhase) {
    Pipeline pipeline("strict");
    auto run = pipeline.Initialize();
    run.RunPhase(Phase::Validate);
    EXPECT_THROW(run.RunPhase(Phase::Validate), LifecycleError);
    run.Run();
    EXPECT_THROW(run.RunPhase(Phase::Extract), LifecycleError);
}

TEST_F(PipelineTest, RunThroughStopsAndResumes) {
    Module chain("chain");
    chain.Add<Phase::Build, ProduceB>().Add<Phase::Extract, ProduceC>();

    Pipeline pipeline("staged");
    pipeline.AddModule(std::move(chain));

    auto run = pipeline.Initialize();
    run.RunThrough(Phase::PreProcess);
    EXPECT_EQ(run.NextPhase(), Phase::Build);
    EXPECT_FALSE(run.GetRegistry().Contains<B>());

    // Data needed by a later phase arrives between phases
    run.AddData(A{10});
    run.RunThrough(Phase::Build);
    EXPECT_EQ(run.GetRegistry().Require<B>().value, 11);

    // Running through a completed phase is a no-op
    run.RunThrough(Phase::Validate);
    EXPECT_EQ(run.CompletedPhases().size(), 3u);

    run.Run();
    EXPECT_EQ(run.GetRegistry().Require<C>().value, 12);
}

TEST_F(PipelineTest, PhaseTimesRecorded) {
    Pipeline pipeline("timed");
    auto run = pipeline.Initialize();
    run.RunThrough(Phase::Build);

    const PhaseTimes *times = run.GetRegistry().Get<PhaseTimes>();
    ASSERT_NE(times, nullptr);
    for (Phase phase : {Phase::Validate, Phase::PreProcess, Phase::Build}) {
        EXPECT_GE(times->Of(phase), 0.0);
    }
    EXPECT_EQ(times->Of(Phase::Solve), 0.0);
    EXPECT_DOUBLE_EQ(run.Times().Total(), times->Total());
}

TEST_F(PipelineTest, FailedPhaseStopsPipeline) {
    Module checks("checks");
    checks.Add<Phase::Validate, CheckA>();
    Pipeline pipeline("failing");
    pipeline.AddModule(std::move(checks));

    auto run = pipeline.Initialize(A{-1});
    EXPECT_THROW(run.Run(), ValidationError);
    EXPECT_TRUE(run.CompletedPhases().empty());
    EXPECT_EQ(run.NextPhase(), Phase::Validate);
}

TEST_F(PipelineTest, PhaseEventsLogged) {
    Pipeline pipeline("logged");
    auto run = pipeline.Initialize();
    run.RunPhase(Phase::Validate);

    auto entries = GetLogService().GetEntriesForStep("validation");
    std::vector<std::string> events;
    for (const auto &e : entries) {
        if (e.level == LogLevel::Event) {
            events.push_back(e.message);
        }
    }
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "Phase 'validation' started");
    EXPECT_NE(events[1].find("Phase 'validation' complete ("), std::string::npos);
}

} // namespace
} // namespace optiframe
