#include "snapshot_serializer.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_facts {

namespace {

template <typename Container>
ordered_json path_list(const Container& paths) {
    ordered_json list = ordered_json::array();
    for (const auto& p : paths) list.push_back(p);
    return list;
}

ordered_json fact_list(const std::vector<Fact>& facts) {
    ordered_json list = ordered_json::array();
    for (const auto& fact : facts) list.push_back(fact.to_json());
    return list;
}

std::set<std::string> read_path_set(const json& document, const std::string& key) {
    std::set<std::string> out;
    if (!document.contains(key)) return out;
    for (const auto& p : document.at(key)) out.insert(p.get<std::string>());
    return out;
}

} // namespace

ordered_json SnapshotSerializer::render_full(const Snapshot& snapshot) {
    ordered_json doc;
    doc["revision"] = snapshot.revision;
    doc["generated_at"] = snapshot.generated_at;
    doc["files_scanned"] = path_list(snapshot.files_scanned);
    doc["files_failed"] = path_list(snapshot.files_failed);
    doc["files_skipped"] = path_list(snapshot.files_skipped);

    ordered_json facts = ordered_json::array();
    for (const auto& [identity, fact] : snapshot.facts) facts.push_back(fact.to_json());
    doc["facts"] = std::move(facts);
    return doc;
}

ordered_json SnapshotSerializer::render_delta(const Changeset& delta) {
    ordered_json doc;
    doc["baseline_revision"] = delta.baseline_revision;
    doc["current_revision"] = delta.current_revision;
    doc["added"] = fact_list(delta.added);
    doc["removed"] = fact_list(delta.removed);

    ordered_json modified = ordered_json::array();
    for (const auto& m : delta.modified) {
        ordered_json entry;
        entry["identity"] = m.identity;
        entry["before"] = m.before.to_json();
        entry["after"] = m.after.to_json();
        modified.push_back(std::move(entry));
    }
    doc["modified"] = std::move(modified);
    doc["degraded_files"] = path_list(delta.degraded_files);
    return doc;
}

Snapshot SnapshotSerializer::load_full(const json& document) {
    if (!document.is_object() || !document.contains("facts") || !document["facts"].is_array()) {
        throw SnapshotFormatError("full-facts document has no facts array");
    }

    Snapshot snapshot;
    try {
        snapshot.revision = document.value("revision", "");
        snapshot.generated_at = document.value("generated_at", "");
        snapshot.files_scanned = read_path_set(document, "files_scanned");
        snapshot.files_failed = read_path_set(document, "files_failed");
        snapshot.files_skipped = read_path_set(document, "files_skipped");

        for (const auto& entry : document["facts"]) {
            Fact fact = Fact::from_json(entry);
            std::string key = fact.identity;
            if (!snapshot.facts.emplace(key, std::move(fact)).second) {
                throw SnapshotFormatError("duplicate identity " + key + " in full-facts document");
            }
        }
    } catch (const json::exception& e) {
        throw SnapshotFormatError(std::string("malformed full-facts document: ") + e.what());
    }
    return snapshot;
}

Snapshot SnapshotSerializer::load_full_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw SnapshotFormatError("cannot open baseline snapshot " + path);

    json document;
    try {
        document = json::parse(f);
    } catch (const json::parse_error& e) {
        throw SnapshotFormatError("baseline snapshot " + path + " is not JSON: " + e.what());
    }
    Snapshot snapshot = load_full(document);
    spdlog::info("📥 Loaded baseline snapshot {} ({} facts) from {}", snapshot.revision, snapshot.facts.size(), path);
    return snapshot;
}

std::string SnapshotSerializer::to_document(const ordered_json& document) {
    return document.dump(2, ' ', false, ordered_json::error_handler_t::replace) + "\n";
}

} // namespace code_facts
