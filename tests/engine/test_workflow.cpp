/**
 * @file test_workflow.cpp
 * @brief Unit tests for multi-step workflows and their initialization
 */

#include <optiframe/engine/Workflow.hpp>
#include <optiframe/io/LogService.hpp>

#include <testing/ChainTasks.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace optiframe {
namespace {

using namespace fixtures;

template <typename W>
concept CanFindStep = requires(W &&w) { std::forward<W>(w).FindStep(std::string{}); };

template <typename W>
concept CanGetStepAt = requires(W &&w) { std::forward<W>(w).StepAt(0); };

template <typename W>
concept CanListSteps = requires(W &&w) { std::forward<W>(w).Steps(); };

class WorkflowTest : public ::testing::Test {
  protected:
    void SetUp() override {
        GetLogService().ClearSinks();
        GetLogService().Clear();
    }

    void TearDown() override { GetLogService().Clear(); }

    /// first: ProduceA, ProduceB; second: ProduceC
    static Workflow ChainWorkflow() {
        Step first("first");
        first.AddTasks<ProduceA, ProduceB>();
        Step second("second");
        second.AddTask<ProduceC>();

        Workflow workflow("chain");
        workflow.AddSteps(std::move(first), std::move(second));
        return workflow;
    }
};

// =============================================================================
// Assembly
// =============================================================================

TEST_F(WorkflowTest, StepsKeptInOrder) {
    Workflow workflow = ChainWorkflow();
    EXPECT_EQ(workflow.Name(), "chain");
    ASSERT_EQ(workflow.NumSteps(), 2u);
    EXPECT_EQ(workflow.StepAt(0).Name(), "first");
    EXPECT_EQ(workflow.StepAt(1).Name(), "second");
    EXPECT_EQ(workflow.Steps()[1].NumTasks(), 1u);
}

TEST_F(WorkflowTest, StepAtOutOfRange) {
    Workflow workflow = ChainWorkflow();
    EXPECT_THROW((void)workflow.StepAt(2), LifecycleError);
}

TEST_F(WorkflowTest, FindStepByName) {
    Workflow workflow = ChainWorkflow();
    const Step *second = workflow.FindStep("second");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->TaskNames(), std::vector<std::string>{"ProduceC"});
    EXPECT_EQ(workflow.FindStep("third"), nullptr);
}

TEST_F(WorkflowTest, StepAccessRequiresLiveWorkflow) {
    // Step references from a temporary workflow would dangle, so the calls do not compile
    static_assert(CanFindStep<const Workflow &>);
    static_assert(CanGetStepAt<Workflow &>);
    static_assert(CanListSteps<const Workflow &>);
    static_assert(!CanFindStep<Workflow>);
    static_assert(!CanGetStepAt<Workflow>);
    static_assert(!CanListSteps<Workflow &&>);

    const Workflow workflow = ChainWorkflow();
    const Step *first = workflow.FindStep("first");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, &workflow.StepAt(0));
    EXPECT_EQ(first, &workflow.Steps().front());
}

TEST_F(WorkflowTest, ApplyOptionsToEveryStep) {
    Workflow workflow = ChainWorkflow();
    workflow.ApplyOptions(StepOptions::Parallel(3));
    for (const auto &step : workflow.Steps()) {
        EXPECT_EQ(step.Options().execution, ExecutionMode::Parallel);
        EXPECT_EQ(step.Options().max_workers, 3u);
    }
    EXPECT_THROW(workflow.ApplyOptions(StepOptions::Parallel(0)), ConfigError);
}

// =============================================================================
// Initialization
// =============================================================================

TEST_F(WorkflowTest, SeedsStoredUnderTheirTypes) {
    Workflow workflow("seeded");
    auto run = workflow.Initialize(A{3}, X{7});
    EXPECT_EQ(run.GetRegistry().Require<A>().value, 3);
    EXPECT_EQ(run.GetRegistry().Require<X>().value, 7);
    EXPECT_EQ(run.GetRegistry().Size(), 2u);
}

TEST_F(WorkflowTest, LaterSeedOfSameTypeWins) {
    Workflow workflow("seeded");
    auto run = workflow.Initialize(A{1}, A{2});
    EXPECT_EQ(run.GetRegistry().Require<A>().value, 2);
}

TEST_F(WorkflowTest, EmptyOptionalSeedSkipped) {
    Workflow workflow("seeded");
    std::optional<B> missing;
    std::optional<C> present = C{4};
    auto run = workflow.Initialize(A{1}, missing, present, std::shared_ptr<X>{});
    EXPECT_TRUE(run.GetRegistry().Contains<A>());
    EXPECT_FALSE(run.GetRegistry().Contains<B>());
    EXPECT_EQ(run.GetRegistry().Require<C>().value, 4);
    EXPECT_FALSE(run.GetRegistry().Contains<X>());
}

TEST_F(WorkflowTest, SharedSeedKeepsIdentity) {
    Workflow workflow("seeded");
    auto shared = std::make_shared<A>(A{5});
    auto run = workflow.Initialize(shared);
    EXPECT_EQ(run.GetRegistry().GetShared<A>(), shared);
}

TEST_F(WorkflowTest, InitializeWithRegistry) {
    Registry data;
    data.Set(B{10});
    Step step("only");
    step.AddTask<ProduceC>();
    Workflow workflow("from_registry");
    workflow.AddStep(std::move(step));

    auto run = workflow.InitializeWith(data);
    run.ExecuteAll();
    EXPECT_EQ(run.GetRegistry().Require<C>().value, 11);
}

TEST_F(WorkflowTest, WorkflowReusableAcrossInitializations) {
    Workflow workflow("reuse");
    Step step("c");
    step.AddTask<ProduceC>();
    workflow.AddStep(std::move(step));

    auto first = workflow.Initialize(B{1});
    auto second = workflow.Initialize(B{100});
    first.ExecuteAll();
    second.ExecuteAll();
    EXPECT_EQ(first.GetRegistry().Require<C>().value, 2);
    EXPECT_EQ(second.GetRegistry().Require<C>().value, 101);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(WorkflowTest, ExecuteAllRunsEveryStep) {
    auto run = ChainWorkflow().Initialize();
    const Registry &result = run.ExecuteAll();
    EXPECT_EQ(result.Require<A>().value, 1);
    EXPECT_EQ(result.Require<B>().value, 2);
    EXPECT_EQ(result.Require<C>().value, 3);
    EXPECT_EQ(&result, &run.GetRegistry());

    ASSERT_EQ(run.Reports().size(), 2u);
    EXPECT_EQ(run.Reports()[0].step, "first");
    EXPECT_EQ(run.Reports()[0].NumPasses(), 2u);
    EXPECT_EQ(run.Reports()[1].step, "second");
}

TEST_F(WorkflowTest, ExecuteStepByStep) {
    auto run = ChainWorkflow().Initialize();
    run.ExecuteStep(0);
    EXPECT_TRUE(run.GetRegistry().Contains<B>());
    EXPECT_FALSE(run.GetRegistry().Contains<C>());

    run.ExecuteStep(1);
    EXPECT_EQ(run.GetRegistry().Require<C>().value, 3);
    EXPECT_EQ(run.Reports().size(), 2u);
}

TEST_F(WorkflowTest, ExecuteStepOutOfRange) {
    auto run = ChainWorkflow().Initialize();
    EXPECT_THROW(run.ExecuteStep(5), LifecycleError);
    EXPECT_TRUE(run.Reports().empty());
}

TEST_F(WorkflowTest, LaterStepSeesEarlierOutputs) {
    // A cross-step dependency resolves once the earlier step has run
    Step produce_x("produce_x");
    produce_x.AddTask(TaskDescriptor::FromFunction<X>("make_x", [] { return X{6}; }));
    Step consume("consume");
    consume.AddTask<CycleY>();

    Workflow workflow("cross");
    workflow.AddSteps(std::move(produce_x), std::move(consume));
    auto run = workflow.Initialize();
    run.ExecuteAll();
    EXPECT_EQ(run.GetRegistry().Require<Y>().value, 6);
}

TEST_F(WorkflowTest, StepAloneMissesEarlierOutputs) {
    Step produce_x("produce_x");
    produce_x.AddTask(TaskDescriptor::FromFunction<X>("make_x", [] { return X{6}; }));
    Step consume("consume");
    consume.AddTask<CycleY>();

    Workflow workflow("cross");
    workflow.AddSteps(std::move(produce_x), std::move(consume));
    auto run = workflow.Initialize();
    try {
        run.ExecuteStep(1);
        FAIL() << "expected ScheduleError";
    } catch (const ScheduleError &e) {
        EXPECT_EQ(e.step(), "consume");
        ASSERT_EQ(e.stuck_tasks().size(), 1u);
        EXPECT_EQ(e.stuck_tasks()[0].missing[0].type, "X");
    }
}

TEST_F(WorkflowTest, AddDataBetweenSteps) {
    Step first("first");
    first.AddTask<ProduceA>();
    Step second("second");
    second.AddTask<ProduceC>();

    Workflow workflow("staged");
    workflow.AddSteps(std::move(first), std::move(second));
    auto run = workflow.Initialize();
    run.ExecuteStep(0);
    run.AddData(B{20}).AddData(std::optional<X>{});
    run.ExecuteStep(1);

    EXPECT_EQ(run.GetRegistry().Require<C>().value, 21);
    EXPECT_FALSE(run.GetRegistry().Contains<X>());
}

TEST_F(WorkflowTest, FailedStepKeepsEarlierResults) {
    Step first("first");
    first.AddTask<ProduceA>();
    Step broken("broken");
    broken.AddTasks<CycleX, CycleY>();

    Workflow workflow("partial");
    workflow.AddSteps(std::move(first), std::move(broken));
    auto run = workflow.Initialize();
    EXPECT_THROW(run.ExecuteAll(), ScheduleError);
    EXPECT_TRUE(run.GetRegistry().Contains<A>());
    EXPECT_EQ(run.Reports().size(), 1u);
}

TEST_F(WorkflowTest, ExecuteAllLogsWorkflowEvents) {
    auto run = ChainWorkflow().Initialize();
    run.ExecuteAll();
    auto events = GetLogService().GetEntriesAtLevel(LogLevel::Event);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_NE(events[0].message.find("Executing workflow 'chain' (2 steps)"), std::string::npos);
    EXPECT_NE(events[1].message.find("Finished workflow 'chain'"), std::string::npos);
}

} // namespace
} // namespace optiframe
