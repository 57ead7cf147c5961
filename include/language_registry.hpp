#pragma once
#include <tree_sitter/api.h>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Grammars are linked from the installed tree-sitter grammar libraries
extern "C" {
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
    const TSLanguage* tree_sitter_go();
    const TSLanguage* tree_sitter_cpp();
}

namespace code_facts {
    namespace syntax {

// How a matched node yields its name segments. A rule may also reject the node.
enum class NameRule {
    Field,              // text of `field`; synthesized when the field is absent
    Callee,             // whitespace-free text of `field` (call targets)
    Module,             // unquoted text of `field`, alias-aware (imports)
    Declarator,         // C/C++ declarator chain, split on "::"
    Receiver,           // Go method: receiver type + `field`
    AssignedOrAnonymous,// own `field`, else the name it is bound to, else synthesized
    FirstNamedChild,    // whitespace-free text of the first named child
    Decorator,          // decorator target, call targets unwrapped
    ExportTarget,       // exported declaration name, clause or "default"
    Docstring           // leading string statement of a module/block
};

struct NodeRule {
    std::string kind;
    NameRule name_rule = NameRule::Field;
    std::string field;          // field consulted by the name rule
    bool opens_scope = false;
    std::string required_field; // node is ignored unless this field is present
};

struct LanguageProfile {
    std::string name;
    const TSLanguage* (*grammar)() = nullptr;
    std::vector<std::string> extensions;
    std::vector<std::string> interpreters;  // shebang program names

    // The capability table: grammar node type -> fact kind + name rule
    std::unordered_map<std::string, NodeRule> rules;

    std::unordered_set<std::string> branch_types;
    std::unordered_set<std::string> comment_types;
    std::unordered_set<std::string> docstring_parents;
    std::unordered_set<std::string> docstring_owners;  // a nested block holds a docstring only under these

    std::string test_prefix;                    // definitions named like this are tests
    std::unordered_set<std::string> test_calls; // calls like it("...") declare tests

    const NodeRule* rule_for(std::string_view node_type) const;
    bool is_comment(std::string_view node_type) const;
    bool is_branch(std::string_view node_type) const;
};

using LanguageHandle = const LanguageProfile*;

// Process-wide, immutable after first use.
class GrammarRegistry {
public:
    static const GrammarRegistry& instance();

    // Extension lookup first; extensionless files fall back to the shebang in `head`.
    std::optional<LanguageHandle> resolve(const std::string& file_path, std::string_view head = {}) const;
    std::optional<LanguageHandle> by_name(std::string_view name) const;

    // True when the extension alone cannot decide and content sniffing may help.
    static bool needs_content_sniff(const std::string& file_path);

private:
    GrammarRegistry();
    std::optional<LanguageHandle> sniff_shebang(std::string_view head) const;

    std::vector<LanguageProfile> profiles_;
    std::unordered_map<std::string, size_t> by_extension_;
    std::unordered_map<std::string, size_t> by_interpreter_;
};

    }
}
