#pragma once
#include <string>
#include <vector>
#include "fact.hpp"
#include "parser_pool.hpp"

namespace code_facts {

/*
 * Walks one syntax tree depth-first and emits a Fact for every named node the
 * language profile's capability table declares interesting. The walker knows
 * nothing about individual languages: node types, name rules, branch types and
 * test conventions all come from the profile.
 *
 * Output facts carry kind, qualified_name, file_path, language, span,
 * complexity (definitions only) and signature_text. identity and
 * signature_hash are left empty for the IdentityResolver.
 */
class FactExtractor {
public:
    std::vector<Fact> extract(const syntax::SyntaxTree& tree, const std::string& file_path) const;

    // "pkg/util/io.py" -> {"pkg", "util", "io"}; Python packages drop "__init__"
    static std::vector<std::string> module_segments(const std::string& file_path, const std::string& language);
};

} // namespace code_facts
