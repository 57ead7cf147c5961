#pragma once
#include <string>
#include "ThreadPool.hpp"
#include "delta.hpp"
#include "engine_config.hpp"
#include "fact_extractor.hpp"
#include "fact_store.hpp"
#include "parser_pool.hpp"
#include "source_tree.hpp"

namespace code_facts {

struct RunSummary {
    size_t current_facts = 0;
    size_t added = 0;
    size_t removed = 0;
    size_t modified = 0;
    size_t degraded_files = 0;
};

class FactEngine {
public:
    explicit FactEngine(size_t workers = 4);

    // resolve -> parse -> extract -> stamp for one file. Never throws for file-local problems.
    FileFacts process_file(const SourceTree& tree, const std::string& path);

    // One task per file on the worker pool, fanned back in path order
    Snapshot build_snapshot(const SourceTree& tree, const std::string& revision, const std::string& generated_at);

    // Baseline and current snapshots are built concurrently, diffed, and both
    // documents are written atomically. Throws IdentityCollisionError,
    // OutputWriteError, ConfigError or SnapshotFormatError.
    RunSummary run(const EngineConfig& config);

private:
    Snapshot build_baseline(const EngineConfig& config, const FilterConfig& filter, const std::string& generated_at);

    ParserPool parsers_;
    FactExtractor extractor_;
    ThreadPool pool_;
};

} // namespace code_facts
