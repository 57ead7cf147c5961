#pragma once
#include <string>
#include <vector>
#include "fact.hpp"
#include "fact_store.hpp"

namespace code_facts {

struct Modification {
    std::string identity;
    Fact before;
    Fact after;
};

// added/removed/modified are pairwise disjoint by identity and each is ordered
// by file path, then qualified name, then identity.
struct Changeset {
    std::string baseline_revision;
    std::string current_revision;
    std::vector<Fact> added;
    std::vector<Fact> removed;
    std::vector<Modification> modified;
    std::vector<std::string> degraded_files;  // failed in either revision, sorted

    bool empty() const { return added.empty() && removed.empty() && modified.empty(); }
};

class DeltaComputer {
public:
    static Changeset diff(const Snapshot& baseline, const Snapshot& current);
};

} // namespace code_facts
