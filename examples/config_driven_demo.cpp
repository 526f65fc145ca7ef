/**
 * @file config_driven_demo.cpp
 * @brief Configuration-Driven Workflow Demo
 *
 * Demonstrates assembling a workflow from YAML:
 * - Engine options and logging from the `engine`/`logging` sections
 * - Steps and task type names from the `workflow` section, resolved via TaskFactory
 * - A dry-run plan before execution
 * - Dependency graph export as JSON and YAML
 *
 * Usage: ./config_driven_demo [config_path] [output_dir]
 *        Default: config/demo_workflow.yaml, current directory
 */

#include <optiframe/optiframe.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <vector>

using namespace optiframe;
namespace fs = std::filesystem;

// =============================================================================
// Domain data
// =============================================================================

struct Readings {
    std::vector<double> values;
};

struct Mean {
    double value = 0.0;
};

struct Variance {
    double value = 0.0;
};

struct Range {
    double min = 0.0;
    double max = 0.0;
};

struct Summary {
    double mean = 0.0;
    double stddev = 0.0;
    double spread = 0.0;
};

OPTIFRAME_TYPE_NAME(Readings, "Readings")
OPTIFRAME_TYPE_NAME(Mean, "Mean")
OPTIFRAME_TYPE_NAME(Variance, "Variance")
OPTIFRAME_TYPE_NAME(Range, "Range")
OPTIFRAME_TYPE_NAME(Summary, "Summary")

// =============================================================================
// Tasks
// =============================================================================

class ComputeMean : public Task<Mean> {
  public:
    static constexpr std::string_view kName = "ComputeMean";
    using Dependencies = Deps<Readings>;

    explicit ComputeMean(const Readings &readings) : readings_(readings) {}

    Mean Execute() override {
        OPTIFRAME_REQUIRE(!readings_.values.empty(), "at least one reading is required");
        const double sum = std::accumulate(readings_.values.begin(), readings_.values.end(), 0.0);
        return Mean{sum / static_cast<double>(readings_.values.size())};
    }

  private:
    const Readings &readings_;
};

class ComputeVariance : public Task<Variance> {
  public:
    static constexpr std::string_view kName = "ComputeVariance";
    using Dependencies = Deps<Readings, Mean>;
    static constexpr std::array<std::string_view, 2> kParameterNames{"readings", "mean"};

    ComputeVariance(const Readings &readings, const Mean &mean)
        : readings_(readings), mean_(mean) {}

    Variance Execute() override {
        double sum = 0.0;
        for (double v : readings_.values) {
            sum += (v - mean_.value) * (v - mean_.value);
        }
        return Variance{sum / static_cast<double>(readings_.values.size())};
    }

  private:
    const Readings &readings_;
    const Mean &mean_;
};

class ComputeRange : public Task<Range> {
  public:
    static constexpr std::string_view kName = "ComputeRange";
    using Dependencies = Deps<Readings>;

    explicit ComputeRange(const Readings &readings) : readings_(readings) {}

    Range Execute() override {
        OPTIFRAME_REQUIRE(!readings_.values.empty(), "at least one reading is required");
        const auto [lo, hi] = std::minmax_element(readings_.values.begin(), readings_.values.end());
        return Range{*lo, *hi};
    }

  private:
    const Readings &readings_;
};

class Summarize : public Task<Summary> {
  public:
    static constexpr std::string_view kName = "Summarize";
    using Dependencies = Deps<Mean, Variance, Range>;

    Summarize(const Mean &mean, const Variance &variance, const Range &range)
        : mean_(mean), variance_(variance), range_(range) {}

    Summary Execute() override {
        OPTIFRAME_LOG_DEBUG("Combining moments");
        return Summary{mean_.value, std::sqrt(variance_.value), range_.max - range_.min};
    }

  private:
    const Mean &mean_;
    const Variance &variance_;
    const Range &range_;
};

OPTIFRAME_REGISTER_TASK(ComputeMean)
OPTIFRAME_REGISTER_TASK(ComputeVariance)
OPTIFRAME_REGISTER_TASK(ComputeRange)
OPTIFRAME_REGISTER_TASK(Summarize)

int main(int argc, char *argv[]) {
    std::string config_path = "config/demo_workflow.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }
    const fs::path output_dir = argc > 2 ? fs::path(argv[2]) : fs::current_path();

    if (!fs::exists(config_path)) {
        std::cerr << "Config not found: " << config_path << "\n";
        std::cerr << "Run from project root or specify path as argument.\n";
        return 1;
    }

    Console console;
    std::cout << "Loading: " << config_path << "\n";

    try {
        // =====================================================================
        // Configuration
        // =====================================================================

        EngineConfig config = io::ConfigLoader::Load(config_path);
        ConfigureLogging(GetLogService(), config.logging, console);

        io::WorkflowDefinition definition = io::WorkflowLoader::Load(config_path);
        Workflow workflow =
            io::WorkflowLoader::Build(definition, TaskFactory::Instance(), config.step);

        std::cout << "  Workflow: " << workflow.Name() << " (" << workflow.NumSteps()
                  << " steps)\n";
        std::cout << "  Execution: " << to_string(config.step.execution) << ", "
                  << config.step.max_workers << " workers\n\n";

        // =====================================================================
        // Dry run and graph export
        // =====================================================================

        const std::vector<TypeKey> seeds{TypeKey::Of<Readings>()};
        const ExecutionPlan plan = DependencyAnalyzer::Plan(workflow, seeds);
        std::cout << plan.ToString() << "\n";
        plan.ThrowIfInvalid();

        const WorkflowGraph graph = WorkflowGraph::Build(workflow, seeds);
        graph.ToJSONFile((output_dir / "statistics_graph.json").string());
        graph.ToYAMLFile((output_dir / "statistics_graph.yaml").string());
        std::cout << "Graph: " << graph.tasks.size() << " tasks, " << graph.edges.size()
                  << " edges written to " << output_dir.string() << "\n\n";

        // =====================================================================
        // Execution
        // =====================================================================

        auto run = workflow.Initialize(Readings{{9.8, 10.1, 10.4, 9.6, 10.0, 10.3}});
        const Registry &result = run.ExecuteAll();

        const auto &summary = result.Require<Summary>();
        std::cout << "\nResults:\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "  mean:   " << summary.mean << "\n";
        std::cout << "  stddev: " << summary.stddev << "\n";
        std::cout << "  spread: " << summary.spread << "\n";
    } catch (const Error &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
