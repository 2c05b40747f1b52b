/**
 * @file main.cpp
 * @brief capsule-run - Command-line interface to the execution engine
 * 
 * Runs one program (from a file, stdin or a request envelope) against an
 * in-memory capability store seeded from fixtures and prints the
 * ExecutionResult JSON on stdout. Diagnostics go to stderr.
 * 
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "capsule/capabilities/memory_store.hpp"
#include "capsule/core/execute_request.hpp"
#include "capsule/core/execution_engine.hpp"
#include "capsule/core/program_loader.hpp"
#include "capsule/core/result_translator.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>

using json = nlohmann::json;

using capsule::core::ErrorKind;
using capsule::core::ExecutionResult;
using capsule::core::ResultTranslator;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

json ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }
    json doc;
    try {
        file >> doc;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    return doc;
}

int Report(const ExecutionResult& result, bool pretty) {
    std::cout << ResultTranslator::ToJsonString(result, pretty) << std::endl;
    return result.success ? 0 : 1;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"capsule-run - run a program against the scoped capability API"};
    app.footer("\nThe program may use top-level await. Its only globals are projectId,\n"
               "meetingId, userId, stories, meetings, risks, storyUpdates, log and console.");

    std::string program_path;
    std::string project_id;
    std::string meeting_id;
    std::string user_id;
    std::string fixtures_path;
    std::string request_path;
    std::string config_path;
    long timeout_ms = 0;
    std::size_t memory_mb = 0;
    bool dump_store = false;
    bool pretty = false;
    bool verbose = false;

    app.add_option("program", program_path, "Program file, or - for stdin");
    app.add_option("--project-id", project_id, "Project the capabilities are scoped to");
    app.add_option("--meeting-id", meeting_id, "Meeting the program acts on behalf of");
    app.add_option("--user-id", user_id, "Acting user recorded on created rows");
    app.add_option("--fixtures", fixtures_path, "JSON fixtures seeding the in-memory store")
        ->check(CLI::ExistingFile);
    app.add_option("--request", request_path, "Request envelope {code, projectId, meetingId?, userId?}")
        ->check(CLI::ExistingFile)
        ->excludes("program");
    app.add_option("--config", config_path, "Engine configuration JSON")
        ->check(CLI::ExistingFile);
    app.add_option("--timeout-ms", timeout_ms,
                   "Script timeout in ms; the overall timeout becomes 5000 ms longer")
        ->check(CLI::PositiveNumber);
    app.add_option("--memory-mb", memory_mb, "Heap limit per isolate in MB")
        ->check(CLI::PositiveNumber);
    app.add_flag("--dump-store", dump_store, "Print the store contents to stderr afterwards");
    app.add_flag("--pretty", pretty, "Pretty-print the result JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Logs on stderr so stdout carries only the result
    spdlog::set_default_logger(spdlog::stderr_color_mt("capsule"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const auto started = std::chrono::steady_clock::now();

    try {
        // Engine configuration: defaults, then file, then flags
        capsule::core::EngineConfig base;
        if (!config_path.empty()) {
            base = capsule::core::LoadEngineConfig(config_path);
        }
        capsule::core::EngineBuilder builder(base);
        if (timeout_ms > 0) {
            builder.WithScriptTimeout(std::chrono::milliseconds(timeout_ms))
                   .WithOverallTimeout(std::chrono::milliseconds(timeout_ms + 5000));
        }
        if (memory_mb > 0) {
            builder.WithMemoryLimit(memory_mb);
        }
        builder.EnableVerboseLogging(verbose || base.verbose_logging);
        capsule::core::EngineConfig config = builder.Build();

        // Backing store
        std::shared_ptr<capsule::capabilities::MemoryStore> store;
        if (!fixtures_path.empty()) {
            store = capsule::capabilities::MemoryStore::LoadFromFile(fixtures_path);
        } else {
            spdlog::warn("No fixtures given, running against an empty store");
            store = std::make_shared<capsule::capabilities::MemoryStore>();
        }

        capsule::core::ExecutionEngine engine(store, config);
        ExecutionResult result;

        if (!request_path.empty()) {
            result = engine.HandleRequest(ReadJsonFile(request_path));
        } else {
            if (program_path.empty() || project_id.empty()) {
                return Report(ResultTranslator::Failure(ErrorKind::INVALID_REQUEST,
                                                        "Missing required fields: code, projectId",
                                                        "", started), pretty);
            }

            capsule::core::ProgramLoader loader(config.max_program_bytes);
            std::string program;
            try {
                program = program_path == "-" ? loader.ReadStream(std::cin)
                                              : loader.LoadFile(program_path);
            }
            catch (const capsule::core::ProgramValidationError& e) {
                return Report(ResultTranslator::Failure(ErrorKind::COMPILE, e.what(), "", started), pretty);
            }

            capsule::core::ExecutionContext context;
            context.project_id = project_id;
            if (!meeting_id.empty()) {
                context.meeting_id = meeting_id;
            }
            if (!user_id.empty()) {
                context.user_id = user_id;
            }

            result = engine.Execute(program, context);
        }

        int exit_code = Report(result, pretty);

        if (dump_store) {
            std::cerr << store->Snapshot().dump(2) << std::endl;
        }

        auto stats = engine.GetStats();
        spdlog::debug("Capability calls: {}, isolates created: {}",
                      stats.capability_calls, stats.pool.created);

        return exit_code;

    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
