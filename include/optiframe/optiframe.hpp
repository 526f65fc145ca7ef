#pragma once

/**
 * @file optiframe.hpp
 * @brief Umbrella header for the Optiframe workflow engine
 *
 * Include this header to get access to all Optiframe public APIs.
 */

// Core
#include <optiframe/core/CoreTypes.hpp>
#include <optiframe/core/Error.hpp>
#include <optiframe/core/ErrorLogging.hpp>
#include <optiframe/core/TypeKey.hpp>

// Engine
#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/Step.hpp>
#include <optiframe/engine/StepOptions.hpp>
#include <optiframe/engine/Task.hpp>
#include <optiframe/engine/TaskDescriptor.hpp>
#include <optiframe/engine/TaskFactory.hpp>
#include <optiframe/engine/Workflow.hpp>

// Pipeline
#include <optiframe/pipeline/Module.hpp>
#include <optiframe/pipeline/Phase.hpp>
#include <optiframe/pipeline/Pipeline.hpp>

// Analysis
#include <optiframe/analysis/DependencyAnalyzer.hpp>
#include <optiframe/analysis/WorkflowGraph.hpp>

// I/O
#include <optiframe/io/ConfigLoader.hpp>
#include <optiframe/io/Console.hpp>
#include <optiframe/io/EngineConfig.hpp>
#include <optiframe/io/LogConfig.hpp>
#include <optiframe/io/LogService.hpp>
#include <optiframe/io/LogSink.hpp>
#include <optiframe/io/WorkflowLoader.hpp>
