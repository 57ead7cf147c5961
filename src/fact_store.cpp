#include "fact_store.hpp"
#include <spdlog/spdlog.h>

namespace code_facts {

IdentityCollisionError::IdentityCollisionError(const std::string& identity, const std::string& first_path, const std::string& second_path)
    : std::runtime_error("identity collision on " + identity + " between " + first_path + " and " + second_path),
      identity_(identity), first_path_(first_path), second_path_(second_path) {}

const Fact* Snapshot::find(const std::string& identity) const {
    auto it = facts.find(identity);
    return it == facts.end() ? nullptr : &it->second;
}

Snapshot FactStore::build(std::string revision, std::string generated_at, std::vector<FileFacts> files) {
    Snapshot snapshot;
    snapshot.revision = std::move(revision);
    snapshot.generated_at = std::move(generated_at);

    for (auto& file : files) {
        switch (file.status) {
        case FileStatus::Skipped:
            snapshot.files_skipped.insert(file.path);
            continue;
        case FileStatus::Failed:
            snapshot.files_scanned.insert(file.path);
            snapshot.files_failed.insert(file.path);
            continue;
        case FileStatus::Parsed:
            snapshot.files_scanned.insert(file.path);
            break;
        }

        for (auto& fact : file.facts) {
            auto existing = snapshot.facts.find(fact.identity);
            if (existing != snapshot.facts.end()) {
                throw IdentityCollisionError(fact.identity, existing->second.file_path, fact.file_path);
            }
            std::string key = fact.identity;
            snapshot.facts.emplace(std::move(key), std::move(fact));
        }
    }

    spdlog::info("📦 Snapshot {}: {} files scanned, {} failed, {} skipped, {} facts",
                 snapshot.revision, snapshot.files_scanned.size(), snapshot.files_failed.size(),
                 snapshot.files_skipped.size(), snapshot.facts.size());
    return snapshot;
}

Snapshot FactStore::build(std::string revision, std::string generated_at,
                          std::vector<std::pair<std::string, std::vector<Fact>>> files) {
    std::vector<FileFacts> converted;
    converted.reserve(files.size());
    for (auto& [path, facts] : files) {
        FileFacts file;
        file.path = path;
        file.facts = std::move(facts);
        converted.push_back(std::move(file));
    }
    return build(std::move(revision), std::move(generated_at), std::move(converted));
}

} // namespace code_facts
