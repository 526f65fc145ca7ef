/**
 * @file hello_workflow.cpp
 * @brief Smallest possible workflow: three chained tasks in one step
 *
 * The tasks are registered in reverse order; the scheduler finds the order
 * from their declared dependencies.
 */

#include <optiframe/optiframe.hpp>

#include <iostream>

using namespace optiframe;

struct A {
    int value = 0;
};

struct B {
    int value = 0;
};

struct C {
    int value = 0;
};

OPTIFRAME_TYPE_NAME(A, "A")
OPTIFRAME_TYPE_NAME(B, "B")
OPTIFRAME_TYPE_NAME(C, "C")

class ProduceA : public Task<A> {
  public:
    static constexpr std::string_view kName = "ProduceA";

    A Execute() override { return A{1}; }
};

class ProduceB : public Task<B> {
  public:
    static constexpr std::string_view kName = "ProduceB";
    using Dependencies = Deps<A>;

    explicit ProduceB(const A &a) : a_(a) {}

    B Execute() override { return B{a_.value + 1}; }

  private:
    const A &a_;
};

class ProduceC : public Task<C> {
  public:
    static constexpr std::string_view kName = "ProduceC";
    using Dependencies = Deps<B>;

    explicit ProduceC(const B &b) : b_(b) {}

    C Execute() override { return C{b_.value + 1}; }

  private:
    const B &b_;
};

int main() {
    Console console;
    GetLogService().AddSink(LogSinks::Console(console));

    std::cout << "=== Optiframe " << Version() << " ===\n\n";

    Step step("chain");
    step.AddTasks<ProduceC, ProduceB, ProduceA>();

    Workflow workflow("hello");
    workflow.AddStep(std::move(step));

    std::cout << DependencyAnalyzer::Plan(workflow).ToString() << "\n";

    auto run = workflow.Initialize();
    try {
        const Registry &result = run.ExecuteAll();
        std::cout << "\nA = " << result.Require<A>().value << "\n";
        std::cout << "B = " << result.Require<B>().value << "\n";
        std::cout << "C = " << result.Require<C>().value << "\n";
    } catch (const Error &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    const StepReport &report = run.Reports().front();
    std::cout << "\nStep '" << report.step << "' ran " << report.NumTasksRun() << " tasks in "
              << report.NumPasses() << " passes\n";
    return 0;
}
