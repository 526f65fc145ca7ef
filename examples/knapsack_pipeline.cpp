/**
 * @file knapsack_pipeline.cpp
 * @brief Phased pipeline demo: a 0/1 knapsack with an optional conflict module
 *
 * The base module validates the items, adds them to the model and extracts the
 * packing. The conflict module forbids packing some item pairs together. The
 * pipeline itself injects the boundary tasks that create the model (build
 * phase) and solve it (solve phase).
 *
 * Usage: ./knapsack_pipeline
 */

#include <optiframe/optiframe.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace optiframe;

namespace knapsack {

// =============================================================================
// Data
// =============================================================================

struct BaseData {
    std::vector<std::string> items;
    std::map<std::string, double> profits;
    std::map<std::string, double> weights;
    double max_weight = 0.0;
};

struct ConflictData {
    std::vector<std::pair<std::string, std::string>> conflicts;
};

/// Solver-facing model: binary variables with one capacity row and pair cuts
struct Model {
    std::string name;
    std::vector<double> objective;
    std::vector<double> weights;
    double capacity = 0.0;
    std::vector<std::pair<std::size_t, std::size_t>> exclusive_pairs;
};

/// Column of each item in the model
struct BaseModelData {
    std::map<std::string, std::size_t> column;
};

struct SolveSettings {
    std::size_t max_columns = 24; ///< Exhaustive search limit
};

struct ModelSolution {
    std::vector<bool> values;
    double objective = 0.0;
};

struct Packing {
    std::vector<std::string> packed_items;
    double profit = 0.0;
    double weight = 0.0;
};

} // namespace knapsack

OPTIFRAME_TYPE_NAME(knapsack::BaseData, "BaseData")
OPTIFRAME_TYPE_NAME(knapsack::ConflictData, "ConflictData")
OPTIFRAME_TYPE_NAME(knapsack::Model, "Model")
OPTIFRAME_TYPE_NAME(knapsack::BaseModelData, "BaseModelData")
OPTIFRAME_TYPE_NAME(knapsack::SolveSettings, "SolveSettings")
OPTIFRAME_TYPE_NAME(knapsack::ModelSolution, "ModelSolution")
OPTIFRAME_TYPE_NAME(knapsack::Packing, "Packing")

namespace knapsack {

// =============================================================================
// Phase-boundary tasks
// =============================================================================

class CreateModel : public Task<Model> {
  public:
    static constexpr std::string_view kName = "CreateModel";
    using Dependencies = Deps<PipelineSettings>;

    explicit CreateModel(const PipelineSettings &settings) : settings_(settings) {}

    Model Execute() override { return Model{.name = settings_.name}; }

  private:
    const PipelineSettings &settings_;
};

class SolveModel : public Task<ModelSolution> {
  public:
    static constexpr std::string_view kName = "SolveModel";
    using Dependencies = Deps<Model, SolveSettings>;

    SolveModel(const Model &model, const SolveSettings &settings)
        : model_(model), settings_(settings) {}

    ModelSolution Execute() override {
        const std::size_t n = model_.objective.size();
        if (n > settings_.max_columns) {
            throw ValidationError("model has " + std::to_string(n) + " columns, limit is " +
                                  std::to_string(settings_.max_columns));
        }

        ModelSolution best{.values = std::vector<bool>(n, false), .objective = 0.0};
        for (std::uint64_t mask = 0; mask < (std::uint64_t{1} << n); ++mask) {
            if (!Feasible(mask)) {
                continue;
            }
            double value = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                if (mask & (std::uint64_t{1} << i)) {
                    value += model_.objective[i];
                }
            }
            if (value > best.objective) {
                best.objective = value;
                for (std::size_t i = 0; i < n; ++i) {
                    best.values[i] = (mask & (std::uint64_t{1} << i)) != 0;
                }
            }
        }
        OPTIFRAME_LOG_INFO("Objective " + std::to_string(best.objective));
        return best;
    }

  private:
    bool Feasible(std::uint64_t mask) const {
        double weight = 0.0;
        for (std::size_t i = 0; i < model_.weights.size(); ++i) {
            if (mask & (std::uint64_t{1} << i)) {
                weight += model_.weights[i];
            }
        }
        if (weight > model_.capacity) {
            return false;
        }
        for (const auto &[a, b] : model_.exclusive_pairs) {
            if ((mask & (std::uint64_t{1} << a)) && (mask & (std::uint64_t{1} << b))) {
                return false;
            }
        }
        return true;
    }

    const Model &model_;
    const SolveSettings &settings_;
};

// =============================================================================
// Base module
// =============================================================================

class ValidateBaseData : public Task<void> {
  public:
    static constexpr std::string_view kName = "ValidateBaseData";
    using Dependencies = Deps<BaseData>;

    explicit ValidateBaseData(const BaseData &data) : data_(data) {}

    void Execute() override {
        OPTIFRAME_REQUIRE(data_.max_weight >= 0, "The maximum weight must be positive");
        for (const auto &item : data_.items) {
            OPTIFRAME_REQUIRE(data_.profits.contains(item), "No profit defined for item " + item);
            OPTIFRAME_REQUIRE(data_.profits.at(item) >= 0,
                              "The profit for item " + item + " must be positive");
            OPTIFRAME_REQUIRE(data_.weights.contains(item), "No weight defined for item " + item);
            OPTIFRAME_REQUIRE(data_.weights.at(item) >= 0,
                              "The weight for item " + item + " must be positive");
        }
    }

  private:
    const BaseData &data_;
};

class BuildBaseModel : public Task<BaseModelData> {
  public:
    static constexpr std::string_view kName = "BuildBaseModel";
    using Dependencies = Deps<BaseData, Model>;
    static constexpr std::array<std::string_view, 2> kParameterNames{"base_data", "model"};

    BuildBaseModel(const BaseData &data, Model &model) : data_(data), model_(model) {}

    BaseModelData Execute() override {
        BaseModelData columns;
        for (const auto &item : data_.items) {
            columns.column[item] = model_.objective.size();
            model_.objective.push_back(data_.profits.at(item));
            model_.weights.push_back(data_.weights.at(item));
        }
        model_.capacity = data_.max_weight;
        return columns;
    }

  private:
    const BaseData &data_;
    Model &model_;
};

class ExtractPacking : public Task<Packing> {
  public:
    static constexpr std::string_view kName = "ExtractPacking";
    using Dependencies = Deps<BaseData, BaseModelData, ModelSolution>;

    ExtractPacking(const BaseData &data, const BaseModelData &columns,
                   const ModelSolution &solution)
        : data_(data), columns_(columns), solution_(solution) {}

    Packing Execute() override {
        Packing packing;
        for (const auto &item : data_.items) {
            if (solution_.values[columns_.column.at(item)]) {
                packing.packed_items.push_back(item);
                packing.profit += data_.profits.at(item);
                packing.weight += data_.weights.at(item);
            }
        }
        return packing;
    }

  private:
    const BaseData &data_;
    const BaseModelData &columns_;
    const ModelSolution &solution_;
};

// =============================================================================
// Conflict module
// =============================================================================

class ValidateConflictData : public Task<void> {
  public:
    static constexpr std::string_view kName = "ValidateConflictData";
    using Dependencies = Deps<BaseData, ConflictData>;

    ValidateConflictData(const BaseData &data, const ConflictData &conflicts)
        : data_(data), conflicts_(conflicts) {}

    void Execute() override {
        auto known = [this](const std::string &item) {
            return std::find(data_.items.begin(), data_.items.end(), item) != data_.items.end();
        };
        for (const auto &[a, b] : conflicts_.conflicts) {
            OPTIFRAME_REQUIRE(known(a), "Item " + a + " is not defined in the base data");
            OPTIFRAME_REQUIRE(known(b), "Item " + b + " is not defined in the base data");
            OPTIFRAME_REQUIRE(a != b, "Item " + a + " is conflicting with itself");
        }
    }

  private:
    const BaseData &data_;
    const ConflictData &conflicts_;
};

class BuildConflicts : public Task<void> {
  public:
    static constexpr std::string_view kName = "BuildConflicts";
    using Dependencies = Deps<BaseModelData, ConflictData, Model>;

    BuildConflicts(const BaseModelData &columns, const ConflictData &conflicts, Model &model)
        : columns_(columns), conflicts_(conflicts), model_(model) {}

    void Execute() override {
        for (const auto &[a, b] : conflicts_.conflicts) {
            model_.exclusive_pairs.emplace_back(columns_.column.at(a), columns_.column.at(b));
        }
    }

  private:
    const BaseModelData &columns_;
    const ConflictData &conflicts_;
    Model &model_;
};

Module BaseModule() {
    Module module("knapsack_base");
    module.Add<Phase::Validate, ValidateBaseData>()
        .Add<Phase::Build, BuildBaseModel>()
        .Add<Phase::Extract, ExtractPacking>();
    return module;
}

Module ConflictModule() {
    Module module("knapsack_conflicts");
    module.Add<Phase::Validate, ValidateConflictData>().Add<Phase::Build, BuildConflicts>();
    return module;
}

Pipeline MakePipeline() {
    Pipeline pipeline("knapsack");
    pipeline.AddPhaseTask<Phase::Build, CreateModel>()
        .AddPhaseTask<Phase::Solve, SolveModel>()
        .AddModules(BaseModule(), ConflictModule());
    return pipeline;
}

BaseData ExampleData() {
    BaseData data;
    data.items = {"laptop", "camera", "tent", "stove", "book"};
    data.profits = {{"laptop", 10}, {"camera", 7}, {"tent", 8}, {"stove", 4}, {"book", 2}};
    data.weights = {{"laptop", 4}, {"camera", 2}, {"tent", 5}, {"stove", 3}, {"book", 1}};
    data.max_weight = 10;
    return data;
}

} // namespace knapsack

int main() {
    Console console;
    GetLogService().AddSink(LogSinks::Console(console));

    std::cout << "=== Knapsack pipeline ===\n\n";

    const Pipeline pipeline = knapsack::MakePipeline();
    const knapsack::ConflictData conflicts{.conflicts = {{"laptop", "tent"}}};

    try {
        auto run = pipeline.Initialize(knapsack::ExampleData(), conflicts);
        run.RunThrough(Phase::Build);
        run.AddData(knapsack::SolveSettings{});
        const Registry &result = run.Run();

        const auto &packing = result.Require<knapsack::Packing>();
        std::cout << "\nPacked:";
        for (const auto &item : packing.packed_items) {
            std::cout << " " << item;
        }
        std::cout << "\nProfit: " << packing.profit << ", weight: " << packing.weight << "\n\n";

        const auto &times = result.Require<PhaseTimes>();
        for (Phase phase : kPhaseOrder) {
            std::cout << Console::PadRight(PhaseName(phase), 22) << std::fixed
                      << std::setprecision(6) << times.Of(phase) << " s\n";
        }
        std::cout << Console::PadRight("total", 22) << times.Total() << " s\n\n";
    } catch (const Error &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // Invalid input stops the pipeline in the validation phase
    knapsack::BaseData broken = knapsack::ExampleData();
    broken.weights.erase("book");
    auto invalid = pipeline.Initialize(broken, conflicts, knapsack::SolveSettings{});
    try {
        invalid.Run();
        std::cerr << "expected a validation error\n";
        return 1;
    } catch (const ValidationError &e) {
        std::cout << "Rejected invalid data: " << e.what() << "\n";
    }
    return 0;
}
