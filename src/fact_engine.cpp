#include "fact_engine.hpp"
#include <exception>
#include <future>
#include <spdlog/spdlog.h>
#include "identity_resolver.hpp"
#include "snapshot_serializer.hpp"
#include "tools/AtomicJournal.hpp"

namespace code_facts {

using syntax::GrammarRegistry;

namespace {
// Enough of the file to read a shebang line
constexpr size_t kSniffBytes = 256;
}

FactEngine::FactEngine(size_t workers) : pool_(workers) {}

FileFacts FactEngine::process_file(const SourceTree& tree, const std::string& path) {
    FileFacts file;
    file.path = path;

    const auto& registry = GrammarRegistry::instance();
    std::optional<std::string> content;
    auto language = registry.resolve(path);
    if (!language && GrammarRegistry::needs_content_sniff(path)) {
        content = tree.read(path);
        if (content) language = registry.resolve(path, std::string_view(*content).substr(0, kSniffBytes));
    }

    if (!language) {
        file.status = FileStatus::Skipped;
        spdlog::debug("SKIP | {} | no grammar", path);
        return file;
    }
    file.language = (*language)->name;

    if (!content) content = tree.read(path);
    if (!content) {
        file.status = FileStatus::Failed;
        file.failure = "content unavailable";
        spdlog::warn("⚠️ {}: content unavailable, contributing no facts", path);
        return file;
    }

    auto parsed = parsers_.parse(*language, std::move(*content));
    if (!parsed.ok()) {
        const auto& failure = *parsed.failure;
        file.status = FileStatus::Failed;
        file.failure = failure.message;
        if (failure.line) {
            spdlog::warn("⚠️ {}:{}:{}: {}", path, *failure.line, failure.column.value_or(0), failure.message);
        } else {
            spdlog::warn("⚠️ {}: {}", path, failure.message);
        }
        return file;
    }

    file.facts = IdentityResolver::stamp(extractor_.extract(*parsed.tree, path));
    spdlog::debug("🛰️  AST X-Ray Complete: Found {} facts in {}", file.facts.size(), path);
    return file;
}

Snapshot FactEngine::build_snapshot(const SourceTree& tree, const std::string& revision, const std::string& generated_at) {
    auto paths = tree.list_files();
    spdlog::info("🔍 Scanning {} files for revision {}", paths.size(), revision);

    std::vector<std::future<FileFacts>> pending;
    pending.reserve(paths.size());
    for (const auto& path : paths) {
        pending.push_back(pool_.enqueue([this, &tree, path]() { return process_file(tree, path); }));
    }

    // Every task holds a reference to `tree`: wait for all of them before rethrowing
    std::vector<FileFacts> files;
    files.reserve(pending.size());
    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            files.push_back(f.get());
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    return FactStore::build(revision, generated_at, std::move(files));
}

Snapshot FactEngine::build_baseline(const EngineConfig& config, const FilterConfig& filter, const std::string& generated_at) {
    if (config.baseline_snapshot) {
        Snapshot baseline = SnapshotSerializer::load_full_file(config.baseline_snapshot->string());
        if (baseline.revision.empty()) {
            baseline.revision = config.baseline_revision;
        } else if (baseline.revision != config.baseline_revision) {
            spdlog::info("Baseline snapshot is labelled {}, keeping that over {}", baseline.revision, config.baseline_revision);
        }
        return baseline;
    }

    if (config.baseline_root) {
        if (config.baseline_manifest) {
            FilesystemTree tree(*config.baseline_root, filter, FilesystemTree::load_manifest(*config.baseline_manifest));
            return build_snapshot(tree, config.baseline_revision, generated_at);
        }
        FilesystemTree tree(*config.baseline_root, filter);
        return build_snapshot(tree, config.baseline_revision, generated_at);
    }

    spdlog::warn("⚠️ No baseline tree or snapshot given; every current fact is reported as added");
    Snapshot empty;
    empty.revision = config.baseline_revision;
    empty.generated_at = generated_at;
    return empty;
}

RunSummary FactEngine::run(const EngineConfig& config) {
    config.validate();
    const std::string generated_at = config.resolve_generated_at();
    const FilterConfig filter = FilterConfig::from_lists(config.allowed_extensions, config.ignored_paths, config.included_paths);

    // 🚀 PHASE 1: both revisions at once, sharing the worker pool
    auto baseline_future = std::async(std::launch::async, [this, &config, &filter, &generated_at]() {
        return build_baseline(config, filter, generated_at);
    });
    FilesystemTree current_tree(config.current_root, filter);
    Snapshot current = build_snapshot(current_tree, config.current_revision, generated_at);
    Snapshot baseline = baseline_future.get();

    // 🚀 PHASE 2: reduce to a changeset
    Changeset delta = DeltaComputer::diff(baseline, current);

    // 🚀 PHASE 3: both documents or neither
    AtomicJournal journal;
    journal.stage(config.out_full.string(), SnapshotSerializer::to_document(SnapshotSerializer::render_full(current)));
    journal.stage(config.out_delta.string(), SnapshotSerializer::to_document(SnapshotSerializer::render_delta(delta)));
    journal.commit();

    RunSummary summary;
    summary.current_facts = current.facts.size();
    summary.added = delta.added.size();
    summary.removed = delta.removed.size();
    summary.modified = delta.modified.size();
    summary.degraded_files = delta.degraded_files.size();

    spdlog::info("✅ Wrote {} facts -> {}", summary.current_facts, config.out_full.string());
    spdlog::info("✅ Wrote delta (+{} -{} ~{}) -> {}", summary.added, summary.removed, summary.modified, config.out_delta.string());
    return summary;
}

} // namespace code_facts
