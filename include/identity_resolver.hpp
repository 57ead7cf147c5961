#pragma once
#include <string>
#include <vector>
#include "fact.hpp"

namespace code_facts {

class IdentityResolver {
public:
    // Fills identity and signature_hash, consuming signature_text. Facts that
    // share (file, qualified name, kind) are told apart by a 0-based ordinal in
    // declaration order; the ordinal is always hashed, so the first occurrence
    // keeps its identity when a second one appears.
    static std::vector<Fact> stamp(std::vector<Fact> facts);

    static std::string identity_for(const std::string& file_path,
                                    const std::vector<std::string>& qualified_name,
                                    const std::string& kind,
                                    size_t ordinal);

    static std::string signature_hash_for(const std::string& kind, const std::string& signature_text);

    static constexpr size_t kHashChars = 16;
};

} // namespace code_facts
