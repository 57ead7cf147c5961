#include "delta.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace code_facts {

Changeset DeltaComputer::diff(const Snapshot& baseline, const Snapshot& current) {
    Changeset delta;
    delta.baseline_revision = baseline.revision;
    delta.current_revision = current.revision;

    // Both maps iterate in identity order, so one merge pass classifies everything.
    auto b = baseline.facts.begin();
    auto c = current.facts.begin();
    while (b != baseline.facts.end() || c != current.facts.end()) {
        if (c == current.facts.end() || (b != baseline.facts.end() && b->first < c->first)) {
            delta.removed.push_back(b->second);
            ++b;
        } else if (b == baseline.facts.end() || c->first < b->first) {
            delta.added.push_back(c->second);
            ++c;
        } else {
            if (b->second.signature_hash != c->second.signature_hash) {
                delta.modified.push_back({c->first, b->second, c->second});
            }
            ++b;
            ++c;
        }
    }

    std::sort(delta.added.begin(), delta.added.end(), fact_order_less);
    std::sort(delta.removed.begin(), delta.removed.end(), fact_order_less);
    std::sort(delta.modified.begin(), delta.modified.end(),
              [](const Modification& x, const Modification& y) { return fact_order_less(x.after, y.after); });

    std::set_union(baseline.files_failed.begin(), baseline.files_failed.end(),
                   current.files_failed.begin(), current.files_failed.end(),
                   std::back_inserter(delta.degraded_files));

    spdlog::info("🧮 Delta {} -> {}: +{} -{} ~{} ({} degraded files)",
                 delta.baseline_revision, delta.current_revision, delta.added.size(),
                 delta.removed.size(), delta.modified.size(), delta.degraded_files.size());
    return delta;
}

} // namespace code_facts
