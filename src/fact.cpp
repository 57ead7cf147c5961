#include "fact.hpp"
#include <stdexcept>
#include <tuple>

namespace code_facts {

std::string join_segments(const std::vector<std::string>& segments, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += sep;
        out += segments[i];
    }
    return out;
}

std::string Fact::qualified_name_string() const {
    return join_segments(qualified_name, ".");
}

bool fact_order_less(const Fact& a, const Fact& b) {
    const std::string qa = a.qualified_name_string();
    const std::string qb = b.qualified_name_string();
    return std::tie(a.file_path, qa, a.identity) < std::tie(b.file_path, qb, b.identity);
}

ordered_json Fact::to_json() const {
    ordered_json j;
    j["identity"] = identity;
    j["kind"] = kind;
    j["qualified_name"] = qualified_name_string();
    j["file_path"] = file_path;
    j["language"] = language;
    j["span"] = {
        {"start_line", span.start_line},
        {"start_col", span.start_col},
        {"end_line", span.end_line},
        {"end_col", span.end_col}
    };
    j["signature_hash"] = signature_hash;
    if (complexity) j["complexity"] = *complexity;
    return j;
}

Fact Fact::from_json(const json& j) {
    Fact fact;
    fact.identity = j.at("identity").get<std::string>();
    fact.kind = j.at("kind").get<std::string>();
    // Segment boundaries are not recoverable from the joined form; keeping the
    // joined string as one segment renders it back byte-for-byte.
    fact.qualified_name = {j.at("qualified_name").get<std::string>()};
    fact.file_path = j.at("file_path").get<std::string>();
    fact.language = j.value("language", "");
    const auto& span = j.at("span");
    fact.span.start_line = span.value("start_line", 0u);
    fact.span.start_col = span.value("start_col", 0u);
    fact.span.end_line = span.value("end_line", 0u);
    fact.span.end_col = span.value("end_col", 0u);
    fact.signature_hash = j.at("signature_hash").get<std::string>();
    if (j.contains("complexity")) fact.complexity = j["complexity"].get<int>();
    return fact;
}

} // namespace code_facts
