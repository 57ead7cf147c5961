#include "engine_config.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_facts {

using json = nlohmann::json;

namespace {

std::optional<fs::path> optional_path(const json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    std::string value = j[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return fs::path(value);
}

} // namespace

std::string format_iso8601(std::time_t seconds) {
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    try {
        cfg.current_root = j.value("current_root", std::string("."));
        cfg.current_revision = j.value("current_revision", std::string("HEAD"));
        cfg.baseline_root = optional_path(j, "baseline_root");
        cfg.baseline_snapshot = optional_path(j, "baseline_snapshot");
        cfg.baseline_manifest = optional_path(j, "baseline_manifest");
        cfg.baseline_revision = j.value("baseline_revision", std::string("HEAD~1"));
        cfg.allowed_extensions = j.value("allowed_extensions", std::vector<std::string>{});
        cfg.ignored_paths = j.value("ignored_paths", std::vector<std::string>{});
        cfg.included_paths = j.value("included_paths", std::vector<std::string>{});
        if (auto p = optional_path(j, "out_full")) cfg.out_full = *p;
        if (auto p = optional_path(j, "out_delta")) cfg.out_delta = *p;
        cfg.workers = j.value("workers", 4);
        cfg.log_level = j.value("log_level", std::string("warn"));
        if (j.contains("generated_at") && j["generated_at"].is_string()) {
            cfg.generated_at = j["generated_at"].get<std::string>();
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("config value has the wrong type: ") + e.what());
    }
    return cfg;
}

EngineConfig EngineConfig::load(const fs::path& config_file) {
    std::ifstream f(config_file);
    if (!f.is_open()) throw ConfigError("cannot open config " + config_file.string());

    try {
        auto j = json::parse(f);
        spdlog::info("🛰️ Config loaded from {}", config_file.string());
        return from_json(j);
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + config_file.string() + ": " + e.what());
    }
}

std::optional<fs::path> EngineConfig::find_config_file() {
    const std::vector<fs::path> search_paths = {
        "code_facts.json",          // 1. Current Working Directory
        "../code_facts.json",       // 2. Parent Directory (build trees)
        ".github/code_facts.json"   // 3. Next to the CI workflow
    };
    for (const auto& path : search_paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) return path;
    }
    return std::nullopt;
}

void EngineConfig::validate() const {
    if (out_full.empty()) throw ConfigError("no output path for the full-facts document");
    if (out_delta.empty()) throw ConfigError("no output path for the delta document");
    if (out_full.lexically_normal() == out_delta.lexically_normal()) {
        throw ConfigError("full-facts and delta documents cannot share a path");
    }
    if (baseline_snapshot && baseline_root) {
        throw ConfigError("choose either a baseline snapshot or a baseline tree, not both");
    }
    if (baseline_manifest && !baseline_root) {
        throw ConfigError("baseline_manifest needs baseline_root to read contents from");
    }
    if (workers < 1) throw ConfigError("workers must be at least 1");
}

std::string EngineConfig::resolve_generated_at() const {
    if (generated_at) return *generated_at;
    if (const char* epoch = std::getenv("SOURCE_DATE_EPOCH")) {
        try {
            return format_iso8601(static_cast<std::time_t>(std::stoll(epoch)));
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring malformed SOURCE_DATE_EPOCH '{}'", epoch);
        }
    }
    return format_iso8601(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

} // namespace code_facts
