/**
 * @file test_dependency_analyzer.cpp
 * @brief Tests for dry-run planning of workflows
 */

#include <optiframe/analysis/DependencyAnalyzer.hpp>

#include <testing/ChainTasks.hpp>

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace optiframe {
namespace {

using namespace fixtures;

Workflow SingleStep(Step step) {
    Workflow workflow("planned");
    workflow.AddStep(std::move(step));
    return workflow;
}

TEST(DependencyAnalyzerTest, ChainPlannedInPasses) {
    Step step("chain");
    step.AddTasks<ProduceC, ProduceB, ProduceA>();

    ExecutionPlan plan = DependencyAnalyzer::Plan(SingleStep(std::move(step)));
    ASSERT_TRUE(plan.IsValid());
    EXPECT_EQ(plan.workflow, "planned");
    ASSERT_EQ(plan.steps.size(), 1u);

    const StepPlan &step_plan = plan.steps[0];
    ASSERT_EQ(step_plan.passes.size(), 3u);
    EXPECT_EQ(step_plan.passes[0], std::vector<std::string>{"ProduceA"});
    EXPECT_EQ(step_plan.passes[2], std::vector<std::string>{"ProduceC"});
    EXPECT_EQ(step_plan.available_after, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(plan.FirstInvalid(), nullptr);
    EXPECT_NO_THROW(plan.ThrowIfInvalid());
}

TEST(DependencyAnalyzerTest, PlanMatchesExecution) {
    auto build = [] {
        Step step("mixed");
        step.AddTasks<ProduceC, ProduceA, ProduceB>();
        step.AddTask(TaskDescriptor::FromFunction<X, A, C>(
            "x", [](const A &a, const C &c) { return X{a.value + c.value}; }));
        return step;
    };

    StepReport report;
    {
        Registry data;
        report = build().Execute(data);
    }
    std::unordered_set<TypeKey> available;
    StepPlan plan = DependencyAnalyzer::PlanStep(build(), available);
    EXPECT_EQ(plan.passes, report.passes);
    EXPECT_EQ(available.size(), 4u);
}

TEST(DependencyAnalyzerTest, SeedsSatisfyDependencies) {
    Step step("needs_b");
    step.AddTask<ProduceC>();
    Workflow workflow = SingleStep(std::move(step));

    EXPECT_FALSE(DependencyAnalyzer::Plan(workflow).IsValid());
    EXPECT_TRUE(DependencyAnalyzer::Plan(workflow, {TypeKey::Of<B>()}).IsValid());

    Registry seeds;
    seeds.Set(B{1});
    ExecutionPlan plan = DependencyAnalyzer::Plan(workflow, seeds);
    ASSERT_TRUE(plan.IsValid());
    EXPECT_EQ(plan.steps[0].available_after, (std::vector<std::string>{"B", "C"}));
}

TEST(DependencyAnalyzerTest, CycleReportedLikeExecution) {
    Step step("cycle");
    step.AddTasks<ProduceA, CycleX, CycleY>();
    ExecutionPlan plan = DependencyAnalyzer::Plan(SingleStep(std::move(step)));

    ASSERT_FALSE(plan.IsValid());
    const StepPlan *bad = plan.FirstInvalid();
    ASSERT_NE(bad, nullptr);
    EXPECT_EQ(bad->step, "cycle");
    EXPECT_EQ(bad->passes.size(), 1u);
    ASSERT_EQ(bad->stuck.size(), 2u);
    EXPECT_EQ(bad->stuck[0].task, "CycleX");
    EXPECT_EQ(bad->stuck[1].task, "CycleY");

    try {
        plan.ThrowIfInvalid();
        FAIL() << "expected ScheduleError";
    } catch (const ScheduleError &e) {
        EXPECT_EQ(e.step(), "cycle");
        EXPECT_TRUE(e.IsStuck("CycleX"));
        EXPECT_TRUE(e.IsStuck("CycleY"));
    }
}

TEST(DependencyAnalyzerTest, OutputsCarryAcrossSteps) {
    Step first("first");
    first.AddTask<ProduceA>();
    Step second("second");
    second.AddTasks<ProduceB, ProduceC>();

    Workflow workflow("two");
    workflow.AddSteps(std::move(first), std::move(second));
    ExecutionPlan plan = DependencyAnalyzer::Plan(workflow);
    ASSERT_TRUE(plan.IsValid());
    ASSERT_EQ(plan.steps.size(), 2u);
    EXPECT_EQ(plan.steps[1].passes.size(), 2u);
}

TEST(DependencyAnalyzerTest, StopsAtFirstInvalidStep) {
    Step first("first");
    first.AddTask<NeedsUnused>();
    Step second("second");
    second.AddTask<ProduceA>();

    Workflow workflow("broken");
    workflow.AddSteps(std::move(first), std::move(second));
    ExecutionPlan plan = DependencyAnalyzer::Plan(workflow);
    ASSERT_EQ(plan.steps.size(), 1u);
    EXPECT_EQ(plan.FirstInvalid()->stuck[0].missing[0].type, "Unused");
}

TEST(DependencyAnalyzerTest, NothingExecuted) {
    int runs = 0;
    Step step("dry");
    step.AddTask(TaskDescriptor::FromFunction<A>("count", [&runs] {
        ++runs;
        return A{};
    }));
    (void)DependencyAnalyzer::Plan(SingleStep(std::move(step)));
    EXPECT_EQ(runs, 0);
}

TEST(DependencyAnalyzerTest, ToStringDescribesPlan) {
    Step step("cycle");
    step.AddTasks<ProduceA, CycleX>();
    const std::string text = DependencyAnalyzer::Plan(SingleStep(std::move(step))).ToString();
    EXPECT_NE(text.find("Plan for workflow 'planned' (INVALID)"), std::string::npos);
    EXPECT_NE(text.find("pass 1: ProduceA"), std::string::npos);
    EXPECT_NE(text.find("stuck CycleX: [y: Y]"), std::string::npos);
}

} // namespace
} // namespace optiframe
