#pragma once
#include <ctime>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_facts {

namespace fs = std::filesystem;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
 * Engine configuration
 *
 * Inputs
 * - current_root / current_revision: working tree being described.
 * - baseline_snapshot: previously captured code_facts_full.json (preferred baseline).
 * - baseline_root: materialized checkout of the baseline revision.
 * - baseline_manifest: newline-separated paths the baseline revision references.
 * - baseline_revision: label for the baseline ("--base-sha").
 *
 * Filtering
 * - allowed_extensions: extension allowlist, empty means every registered grammar.
 * - ignored_paths / included_paths: repository-relative prefixes.
 *
 * Outputs and runtime
 * - out_full / out_delta: document paths.
 * - workers: parse/extract threads.
 * - log_level: spdlog level name.
 * - generated_at: pinned ISO-8601 stamp; otherwise SOURCE_DATE_EPOCH, otherwise now.
 */
struct EngineConfig {
    fs::path current_root = ".";
    std::string current_revision = "HEAD";
    std::optional<fs::path> baseline_root;
    std::optional<fs::path> baseline_snapshot;
    std::optional<fs::path> baseline_manifest;
    std::string baseline_revision = "HEAD~1";

    std::vector<std::string> allowed_extensions;
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;

    fs::path out_full;
    fs::path out_delta;

    int workers = 4;
    std::string log_level = "warn";
    std::optional<std::string> generated_at;

    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig load(const fs::path& config_file);

    // code_facts.json in ".", "..", ".github" (first hit wins)
    static std::optional<fs::path> find_config_file();

    // Throws ConfigError on contradictory or missing inputs
    void validate() const;

    std::string resolve_generated_at() const;
};

std::string format_iso8601(std::time_t seconds);

} // namespace code_facts
