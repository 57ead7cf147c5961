#include "identity_resolver.hpp"
#include <unordered_map>
#include "digest.hpp"

namespace code_facts {

namespace {
// ASCII unit/record separators never occur in paths or identifiers
const std::string kUnit = "\x1f";
const std::string kRecord = "\x1e";

std::string raw_key(const std::string& file_path, const std::vector<std::string>& qualified_name, const std::string& kind) {
    return file_path + kUnit + join_segments(qualified_name, kRecord) + kUnit + kind;
}
}

std::string IdentityResolver::identity_for(const std::string& file_path,
                                           const std::vector<std::string>& qualified_name,
                                           const std::string& kind,
                                           size_t ordinal) {
    std::string key = raw_key(file_path, qualified_name, kind) + kUnit + std::to_string(ordinal);
    return "CU-" + sha1_hex(key, kHashChars);
}

std::string IdentityResolver::signature_hash_for(const std::string& kind, const std::string& signature_text) {
    return sha1_hex(kind + kUnit + signature_text, kHashChars);
}

std::vector<Fact> IdentityResolver::stamp(std::vector<Fact> facts) {
    std::unordered_map<std::string, size_t> seen;
    for (auto& fact : facts) {
        size_t ordinal = seen[raw_key(fact.file_path, fact.qualified_name, fact.kind)]++;
        fact.identity = identity_for(fact.file_path, fact.qualified_name, fact.kind, ordinal);
        fact.signature_hash = signature_hash_for(fact.kind, fact.signature_text);
        fact.signature_text.clear();
    }
    return facts;
}

} // namespace code_facts
