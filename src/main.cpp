#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

#include "engine_config.hpp"
#include "fact_engine.hpp"
#include "fact_store.hpp"
#include "snapshot_serializer.hpp"
#include "tools/AtomicJournal.hpp"

using namespace code_facts;

namespace {

// Each -v lowers the starting level one step
spdlog::level::level_enum effective_level(const std::string& configured, int verbosity) {
    auto level = spdlog::level::from_str(configured);
    if (level == spdlog::level::off && configured != "off") level = spdlog::level::warn;
    int lowered = static_cast<int>(level) - verbosity;
    if (lowered < static_cast<int>(spdlog::level::trace)) lowered = static_cast<int>(spdlog::level::trace);
    return static_cast<spdlog::level::level_enum>(lowered);
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"code_facts: structural fact extraction and revision delta"};

    std::string config_arg;
    std::string out_full_arg;
    std::string out_delta_arg;
    std::string base_sha_arg;
    std::string current_root_arg;
    std::string current_revision_arg;
    std::string baseline_root_arg;
    std::string baseline_snapshot_arg;
    std::string baseline_manifest_arg;
    int workers_arg = 0;
    int verbosity = 0;

    app.add_option("--config", config_arg, "Config file (default: code_facts.json lookup)");
    app.add_option("--out-full", out_full_arg, "Path for code_facts_full.json");
    app.add_option("--out-delta", out_delta_arg, "Path for code_facts_delta.json");
    app.add_option("--base-sha", base_sha_arg, "Baseline revision label");
    app.add_option("--current-root", current_root_arg, "Working tree to describe");
    app.add_option("--current-revision", current_revision_arg, "Current revision label");
    app.add_option("--baseline-root", baseline_root_arg, "Materialized baseline checkout");
    app.add_option("--baseline-snapshot", baseline_snapshot_arg, "Previously captured full-facts document");
    app.add_option("--baseline-manifest", baseline_manifest_arg, "Newline-separated baseline file list");
    app.add_option("--workers", workers_arg, "Parse/extract threads");
    app.add_flag("-v,--verbose", verbosity, "More logging (repeatable)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    EngineConfig config;
    try {
        // 🚀 PHASE 1: config file, then command-line overrides
        if (!config_arg.empty()) {
            config = EngineConfig::load(config_arg);
        } else if (auto found = EngineConfig::find_config_file()) {
            config = EngineConfig::load(*found);
        }
        if (!out_full_arg.empty()) config.out_full = out_full_arg;
        if (!out_delta_arg.empty()) config.out_delta = out_delta_arg;
        if (!base_sha_arg.empty()) config.baseline_revision = base_sha_arg;
        if (!current_root_arg.empty()) config.current_root = current_root_arg;
        if (!current_revision_arg.empty()) config.current_revision = current_revision_arg;
        if (!baseline_root_arg.empty()) config.baseline_root = fs::path(baseline_root_arg);
        if (!baseline_snapshot_arg.empty()) config.baseline_snapshot = fs::path(baseline_snapshot_arg);
        if (!baseline_manifest_arg.empty()) config.baseline_manifest = fs::path(baseline_manifest_arg);
        if (workers_arg > 0) config.workers = workers_arg;

        spdlog::set_level(effective_level(config.log_level, verbosity));
        config.validate();
    } catch (const ConfigError& e) {
        spdlog::error("❌ Config error: {}", e.what());
        return 1;
    }

    // 🚀 PHASE 2: extract, diff, write
    try {
        FactEngine engine(static_cast<size_t>(config.workers));
        RunSummary summary = engine.run(config);
        spdlog::info("🏁 Done: {} facts, +{} -{} ~{}, {} degraded files",
                     summary.current_facts, summary.added, summary.removed, summary.modified, summary.degraded_files);
        return 0;
    } catch (const OutputWriteError& e) {
        spdlog::error("❌ Could not write {}: {}", e.path(), e.what());
        return 2;
    } catch (const IdentityCollisionError& e) {
        spdlog::error("❌ Internal consistency violation: {}", e.what());
        return 1;
    } catch (const SnapshotFormatError& e) {
        spdlog::error("❌ Baseline snapshot unusable: {}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        spdlog::error("❌ Config error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("❌ Fatal: {}", e.what());
        return 1;
    }
}
