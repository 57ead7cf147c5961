#include "language_registry.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace code_facts::syntax {

namespace fs = std::filesystem;

const NodeRule* LanguageProfile::rule_for(std::string_view node_type) const {
    auto it = rules.find(std::string(node_type));
    return it == rules.end() ? nullptr : &it->second;
}

bool LanguageProfile::is_comment(std::string_view node_type) const {
    return comment_types.count(std::string(node_type)) > 0;
}

bool LanguageProfile::is_branch(std::string_view node_type) const {
    return branch_types.count(std::string(node_type)) > 0;
}

namespace {

NodeRule definition(std::string field, bool scope = true) {
    return NodeRule{"definition", NameRule::Field, std::move(field), scope, ""};
}

NodeRule anonymous_definition(std::string field = "") {
    return NodeRule{"definition", NameRule::AssignedOrAnonymous, std::move(field), true, ""};
}

LanguageProfile python_profile() {
    LanguageProfile p;
    p.name = "python";
    p.grammar = tree_sitter_python;
    p.extensions = {".py", ".pyi"};
    p.interpreters = {"python"};
    p.rules = {
        {"function_definition", definition("name")},
        {"class_definition", definition("name")},
        {"lambda", anonymous_definition()},
        {"import_statement", {"import", NameRule::Module, "name", false, ""}},
        {"import_from_statement", {"import", NameRule::Module, "module_name", false, ""}},
        {"decorator", {"annotation", NameRule::Decorator, "", false, ""}},
        {"call", {"reference", NameRule::Callee, "function", false, ""}},
        {"type", {"annotation", NameRule::FirstNamedChild, "", false, ""}},
        {"expression_statement", {"docstring", NameRule::Docstring, "", false, ""}},
    };
    p.branch_types = {"if_statement", "elif_clause", "for_statement", "while_statement",
                      "try_statement", "except_clause", "with_statement", "match_statement",
                      "conditional_expression"};
    p.comment_types = {"comment"};
    p.docstring_parents = {"module", "block"};
    p.docstring_owners = {"function_definition", "class_definition"};
    p.test_prefix = "test_";
    return p;
}

// Shared between JavaScript, TypeScript and TSX
void add_ecmascript_rules(LanguageProfile& p) {
    p.rules = {
        {"function_declaration", definition("name")},
        {"generator_function_declaration", definition("name")},
        {"class_declaration", definition("name")},
        {"method_definition", definition("name")},
        {"class", anonymous_definition("name")},
        {"function_expression", anonymous_definition("name")},
        {"function", anonymous_definition("name")},
        {"generator_function", anonymous_definition("name")},
        {"arrow_function", anonymous_definition()},
        {"import_statement", {"import", NameRule::Module, "source", false, ""}},
        {"export_statement", {"export", NameRule::ExportTarget, "", false, ""}},
        {"call_expression", {"reference", NameRule::Callee, "function", false, ""}},
        {"decorator", {"annotation", NameRule::Decorator, "", false, ""}},
    };
    p.branch_types = {"if_statement", "for_statement", "for_in_statement", "while_statement",
                      "do_statement", "switch_case", "catch_clause", "ternary_expression"};
    p.comment_types = {"comment", "html_comment"};
    p.test_calls = {"it", "test", "describe"};
}

LanguageProfile javascript_profile() {
    LanguageProfile p;
    p.name = "javascript";
    p.grammar = tree_sitter_javascript;
    p.extensions = {".js", ".jsx", ".mjs", ".cjs"};
    p.interpreters = {"node", "nodejs"};
    add_ecmascript_rules(p);
    return p;
}

void add_typescript_rules(LanguageProfile& p) {
    add_ecmascript_rules(p);
    p.rules.insert({
        {"interface_declaration", definition("name")},
        {"abstract_class_declaration", definition("name")},
        {"internal_module", definition("name")},
        {"module", definition("name")},
        {"type_alias_declaration", definition("name", false)},
        {"enum_declaration", definition("name", false)},
        {"function_signature", definition("name", false)},
        {"method_signature", definition("name", false)},
        {"abstract_method_signature", definition("name", false)},
        {"type_annotation", {"annotation", NameRule::FirstNamedChild, "", false, ""}},
    });
}

LanguageProfile typescript_profile() {
    LanguageProfile p;
    p.name = "typescript";
    p.grammar = tree_sitter_typescript;
    p.extensions = {".ts", ".mts", ".cts"};
    add_typescript_rules(p);
    return p;
}

LanguageProfile tsx_profile() {
    LanguageProfile p;
    p.name = "tsx";
    p.grammar = tree_sitter_tsx;
    p.extensions = {".tsx"};
    add_typescript_rules(p);
    return p;
}

LanguageProfile go_profile() {
    LanguageProfile p;
    p.name = "go";
    p.grammar = tree_sitter_go;
    p.extensions = {".go"};
    p.rules = {
        {"function_declaration", definition("name")},
        {"method_declaration", {"definition", NameRule::Receiver, "name", true, ""}},
        {"type_spec", definition("name", false)},
        {"func_literal", anonymous_definition()},
        {"import_spec", {"import", NameRule::Module, "path", false, ""}},
        {"call_expression", {"reference", NameRule::Callee, "function", false, ""}},
    };
    p.branch_types = {"if_statement", "for_statement", "expression_switch_statement",
                      "type_switch_statement", "select_statement"};
    p.comment_types = {"comment"};
    p.test_prefix = "Test";
    return p;
}

LanguageProfile cpp_profile() {
    LanguageProfile p;
    p.name = "cpp";
    p.grammar = tree_sitter_cpp;
    p.extensions = {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx", ".h"};
    p.rules = {
        {"function_definition", {"definition", NameRule::Declarator, "declarator", true, ""}},
        {"class_specifier", {"definition", NameRule::Field, "name", true, "body"}},
        {"struct_specifier", {"definition", NameRule::Field, "name", true, "body"}},
        {"enum_specifier", {"definition", NameRule::Field, "name", false, "body"}},
        {"namespace_definition", {"definition", NameRule::Field, "name", true, "body"}},
        {"lambda_expression", anonymous_definition()},
        {"preproc_include", {"import", NameRule::Module, "path", false, ""}},
        {"call_expression", {"reference", NameRule::Callee, "function", false, ""}},
    };
    p.branch_types = {"if_statement", "for_statement", "for_range_loop", "while_statement",
                      "do_statement", "case_statement", "catch_clause", "conditional_expression"};
    p.comment_types = {"comment"};
    return p;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

GrammarRegistry::GrammarRegistry() {
    profiles_.push_back(python_profile());
    profiles_.push_back(javascript_profile());
    profiles_.push_back(typescript_profile());
    profiles_.push_back(tsx_profile());
    profiles_.push_back(go_profile());
    profiles_.push_back(cpp_profile());

    for (size_t i = 0; i < profiles_.size(); ++i) {
        for (const auto& ext : profiles_[i].extensions) by_extension_[ext] = i;
        for (const auto& prog : profiles_[i].interpreters) by_interpreter_[prog] = i;
    }
}

const GrammarRegistry& GrammarRegistry::instance() {
    static const GrammarRegistry registry;
    return registry;
}

bool GrammarRegistry::needs_content_sniff(const std::string& file_path) {
    return fs::path(file_path).extension().empty();
}

std::optional<LanguageHandle> GrammarRegistry::resolve(const std::string& file_path, std::string_view head) const {
    std::string ext = lowercase(fs::path(file_path).extension().string());
    if (!ext.empty()) {
        auto it = by_extension_.find(ext);
        if (it == by_extension_.end()) return std::nullopt;
        return &profiles_[it->second];
    }
    return sniff_shebang(head);
}

std::optional<LanguageHandle> GrammarRegistry::by_name(std::string_view name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) return &profile;
    }
    return std::nullopt;
}

// "#!/usr/bin/env python3 -u" and "#!/usr/bin/python3.11" both resolve to python
std::optional<LanguageHandle> GrammarRegistry::sniff_shebang(std::string_view head) const {
    if (head.size() < 2 || head.substr(0, 2) != "#!") return std::nullopt;
    size_t eol = head.find('\n');
    std::string line(head.substr(2, eol == std::string_view::npos ? std::string_view::npos : eol - 2));

    std::istringstream words(line);
    std::string word;
    std::string program;
    while (words >> word) {
        std::string base = fs::path(word).filename().string();
        if (base == "env" || (!base.empty() && base[0] == '-')) continue;
        program = base;
        break;
    }
    while (!program.empty() && (std::isdigit(static_cast<unsigned char>(program.back())) || program.back() == '.')) {
        program.pop_back();
    }
    if (program.empty()) return std::nullopt;

    auto it = by_interpreter_.find(program);
    if (it == by_interpreter_.end()) return std::nullopt;
    return &profiles_[it->second];
}

} // namespace code_facts::syntax
