/**
 * @file test_config_loader.cpp
 * @brief Tests for loading the engine configuration from YAML
 */

#include <optiframe/io/ConfigLoader.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace optiframe;
using optiframe::io::ConfigLoader;

namespace {

bool Contains(const std::string &text, const std::string &part) {
    return text.find(part) != std::string::npos;
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(ConfigLoader, EmptyDocumentGivesDefaults) {
    auto cfg = ConfigLoader::Parse("");
    EXPECT_EQ(cfg.step.duplicate_outputs, DuplicateOutputPolicy::LastWriteWins);
    EXPECT_EQ(cfg.step.execution, ExecutionMode::Sequential);
    EXPECT_EQ(cfg.step.max_workers, 4u);
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Info);
    EXPECT_FALSE(cfg.logging.file_enabled);
    EXPECT_EQ(cfg.source_file, "<string>");
}

TEST(ConfigLoader, UnrelatedSectionsIgnored) {
    auto cfg = ConfigLoader::Parse(R"(
workflow:
  name: demo
  steps: []
)");
    EXPECT_EQ(cfg.step.execution, ExecutionMode::Sequential);
}

// =============================================================================
// Engine section
// =============================================================================

TEST(ConfigLoader, EngineSection) {
    auto cfg = ConfigLoader::Parse(R"(
engine:
  duplicate_outputs: error
  execution: Parallel
  max_workers: 8
)");
    EXPECT_EQ(cfg.step.duplicate_outputs, DuplicateOutputPolicy::Error);
    EXPECT_EQ(cfg.step.execution, ExecutionMode::Parallel);
    EXPECT_EQ(cfg.step.max_workers, 8u);
}

TEST(ConfigLoader, UnknownExecutionModeHasHint) {
    try {
        (void)ConfigLoader::Parse(R"(
engine:
  execution: eventually
)");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_TRUE(Contains(e.what(), "invalid value 'eventually' for 'engine.execution'"));
        EXPECT_EQ(e.hint(), "use sequential or parallel");
        EXPECT_EQ(e.line(), 3);
    }
}

TEST(ConfigLoader, UnknownDuplicatePolicy) {
    EXPECT_THROW((void)ConfigLoader::Parse("engine:\n  duplicate_outputs: first_wins\n"),
                 ConfigError);
}

TEST(ConfigLoader, NegativeWorkersRejected) {
    EXPECT_THROW((void)ConfigLoader::Parse("engine:\n  max_workers: -1\n"), ConfigError);
}

TEST(ConfigLoader, NonNumericWorkersRejected) {
    try {
        (void)ConfigLoader::Parse("engine:\n  max_workers: many\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_TRUE(Contains(e.what(), "engine.max_workers"));
    }
}

TEST(ConfigLoader, ParallelWithZeroWorkersFailsValidation) {
    try {
        (void)ConfigLoader::Parse("engine:\n  execution: parallel\n  max_workers: 0\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_TRUE(Contains(e.what(), "max_workers must be at least 1"));
    }
}

TEST(ConfigLoader, SequentialWithZeroWorkersAllowed) {
    auto cfg = ConfigLoader::Parse("engine:\n  max_workers: 0\n");
    EXPECT_EQ(cfg.step.max_workers, 0u);
}

TEST(ConfigLoader, EngineMustBeMapping) {
    EXPECT_THROW((void)ConfigLoader::Parse("engine: [1, 2]\n"), ConfigError);
}

TEST(ConfigLoader, TopLevelMustBeMapping) {
    EXPECT_THROW((void)ConfigLoader::Parse("- just\n- a list\n"), ConfigError);
}

// =============================================================================
// Logging section
// =============================================================================

TEST(ConfigLoader, LoggingSection) {
    auto cfg = ConfigLoader::Parse(R"(
logging:
  console_level: warn
  quiet: true
  file: run.log
  file_level: trace
  file_format: json
)");
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Warning);
    EXPECT_TRUE(cfg.logging.quiet_mode);
    EXPECT_TRUE(cfg.logging.file_enabled);
    EXPECT_EQ(cfg.logging.file_path, "run.log");
    EXPECT_EQ(cfg.logging.file_level, LogLevel::Trace);
    EXPECT_TRUE(cfg.logging.file_json);
    EXPECT_EQ(cfg.logging.EffectiveConsoleLevel(), LogLevel::Error);
}

TEST(ConfigLoader, TextFileFormatByDefault) {
    auto cfg = ConfigLoader::Parse("logging:\n  file: run.log\n");
    EXPECT_FALSE(cfg.logging.file_json);
    EXPECT_EQ(cfg.logging.file_level, LogLevel::Debug);
}

TEST(ConfigLoader, BadLogLevel) {
    try {
        (void)ConfigLoader::Parse("logging:\n  console_level: shouty\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_TRUE(Contains(e.what(), "logging.console_level"));
        EXPECT_TRUE(Contains(e.hint(), "warning"));
    }
}

TEST(ConfigLoader, BadFileFormat) {
    try {
        (void)ConfigLoader::Parse("logging:\n  file: x.log\n  file_format: xml\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(e.hint(), "use text or json");
    }
}

// =============================================================================
// Files
// =============================================================================

TEST(ConfigLoader, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "optiframe_test_engine.yaml";
    {
        std::ofstream out(path);
        out << "engine:\n  execution: parallel\n  max_workers: 2\n";
    }

    auto cfg = ConfigLoader::Load(path.string());
    EXPECT_EQ(cfg.step.execution, ExecutionMode::Parallel);
    EXPECT_EQ(cfg.step.max_workers, 2u);
    EXPECT_EQ(cfg.source_file, path.string());
    std::filesystem::remove(path);
}

TEST(ConfigLoader, MissingFile) {
    try {
        (void)ConfigLoader::Load("/nonexistent/optiframe.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(e.file(), "/nonexistent/optiframe.yaml");
        EXPECT_EQ(e.hint(), "check that the file exists");
    }
}

TEST(ConfigLoader, InvalidYaml) {
    EXPECT_THROW((void)ConfigLoader::Parse("engine: [unclosed\n"), ConfigError);
}
