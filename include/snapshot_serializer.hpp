#pragma once
#include <stdexcept>
#include <string>
#include "delta.hpp"
#include "fact.hpp"
#include "fact_store.hpp"

namespace code_facts {

class SnapshotFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SnapshotSerializer {
public:
    // code_facts_full.json; facts sorted by identity
    static ordered_json render_full(const Snapshot& snapshot);

    // code_facts_delta.json
    static ordered_json render_delta(const Changeset& delta);

    // Rebuilds a snapshot from a previously rendered full-facts document
    static Snapshot load_full(const json& document);
    static Snapshot load_full_file(const std::string& path);

    // Pretty-printed text with a trailing newline. Invalid UTF-8 is replaced, not thrown.
    static std::string to_document(const ordered_json& document);
};

} // namespace code_facts
