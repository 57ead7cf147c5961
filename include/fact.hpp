#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_facts {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// Closed core set of fact kinds. Language profiles may add their own tags.
namespace kinds {
    inline const std::string definition = "definition";
    inline const std::string reference = "reference";
    inline const std::string import = "import";
    inline const std::string exported = "export";
    inline const std::string annotation = "annotation";
    inline const std::string docstring = "docstring";
    inline const std::string test_case = "test_case";
}

// Lines are 1-based, columns are 0-based byte offsets (tree-sitter points).
struct Span {
    uint32_t start_line = 0;
    uint32_t start_col = 0;
    uint32_t end_line = 0;
    uint32_t end_col = 0;
};

struct Fact {
    std::string identity;
    std::string kind;
    std::vector<std::string> qualified_name;
    std::string file_path;
    std::string language;
    Span span;
    std::string signature_hash;
    std::optional<int> complexity;

    // Normalized token stream fed to the signature hash. Never serialized.
    std::string signature_text;

    std::string qualified_name_string() const;

    ordered_json to_json() const;
    static Fact from_json(const json& j);
};

// Ordering used by every changeset list: file, then qualified name, then identity.
bool fact_order_less(const Fact& a, const Fact& b);

std::string join_segments(const std::vector<std::string>& segments, const std::string& sep);

} // namespace code_facts
