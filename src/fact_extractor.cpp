#include "fact_extractor.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <optional>

namespace code_facts {

namespace fs = std::filesystem;
using syntax::LanguageProfile;
using syntax::NameRule;
using syntax::NodeRule;

namespace {

using Segments = std::vector<std::string>;

std::string node_text(TSNode node, const std::string& src) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end <= start || end > src.size()) return "";
    return src.substr(start, end - start);
}

std::string compact(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }), s.end());
    return s;
}

std::string unquote(std::string s) {
    if (s.size() >= 2) {
        char first = s.front();
        char last = s.back();
        if ((first == '"' || first == '\'' || first == '`') && last == first) return s.substr(1, s.size() - 2);
        if (first == '<' && last == '>') return s.substr(1, s.size() - 2);
    }
    return s;
}

TSNode field(TSNode node, const std::string& name) {
    return ts_node_child_by_field_name(node, name.c_str(), static_cast<uint32_t>(name.size()));
}

TSNode first_named_child(TSNode node, const LanguageProfile& profile) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!profile.is_comment(ts_node_type(child))) return child;
    }
    return TSNode{};
}

size_t non_comment_named_children(TSNode node, const LanguageProfile& profile) {
    size_t n = 0;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (!profile.is_comment(ts_node_type(ts_node_named_child(node, i)))) ++n;
    }
    return n;
}

// Index among the parent's named children, comments excluded so that adding a
// comment never renames an anonymous construct.
size_t position_in_parent(TSNode node, const LanguageProfile& profile) {
    TSNode parent = ts_node_parent(node);
    if (ts_node_is_null(parent)) return 0;
    size_t pos = 0;
    uint32_t count = ts_node_named_child_count(parent);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(parent, i);
        if (profile.is_comment(ts_node_type(child))) continue;
        if (ts_node_eq(child, node)) return pos;
        ++pos;
    }
    return pos;
}

std::string synthesized_name(TSNode node, const NodeRule& rule, const LanguageProfile& profile) {
    return "<anon:" + rule.kind + ":" + std::to_string(position_in_parent(node, profile)) + ">";
}

Segments split_scoped(const std::string& text) {
    Segments out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t pos = text.find("::", start);
        std::string part = text.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!part.empty()) out.push_back(part);
        if (pos == std::string::npos) break;
        start = pos + 2;
    }
    return out;
}

bool is_declarator(const char* type) {
    static const char* suffix = "_declarator";
    size_t len = std::strlen(type);
    size_t slen = std::strlen(suffix);
    return len > slen && std::strcmp(type + len - slen, suffix) == 0;
}

std::optional<Segments> resolve_name(TSNode node, const NodeRule& rule, const LanguageProfile& profile, const std::string& src) {
    if (!rule.required_field.empty() && ts_node_is_null(field(node, rule.required_field))) return std::nullopt;

    switch (rule.name_rule) {
    case NameRule::Field: {
        TSNode n = field(node, rule.field);
        if (ts_node_is_null(n)) return Segments{synthesized_name(node, rule, profile)};
        return Segments{compact(node_text(n, src))};
    }
    case NameRule::Callee: {
        TSNode n = field(node, rule.field);
        if (ts_node_is_null(n)) return std::nullopt;
        return Segments{compact(node_text(n, src))};
    }
    case NameRule::Module: {
        TSNode n = field(node, rule.field);
        if (ts_node_is_null(n)) return std::nullopt;
        if (std::strcmp(ts_node_type(n), "aliased_import") == 0) {
            TSNode inner = field(n, "name");
            if (!ts_node_is_null(inner)) n = inner;
        }
        std::string module = unquote(compact(node_text(n, src)));
        if (module.empty()) return std::nullopt;
        return Segments{module};
    }
    case NameRule::Declarator: {
        TSNode d = field(node, rule.field);
        while (!ts_node_is_null(d) && is_declarator(ts_node_type(d))) {
            TSNode next = field(d, "declarator");
            if (ts_node_is_null(next)) next = first_named_child(d, profile);
            d = next;
        }
        if (ts_node_is_null(d)) return Segments{synthesized_name(node, rule, profile)};
        Segments parts = split_scoped(compact(node_text(d, src)));
        if (parts.empty()) return Segments{synthesized_name(node, rule, profile)};
        return parts;
    }
    case NameRule::Receiver: {
        TSNode n = field(node, rule.field);
        if (ts_node_is_null(n)) return Segments{synthesized_name(node, rule, profile)};
        std::string name = compact(node_text(n, src));

        TSNode receiver = field(node, "receiver");
        if (ts_node_is_null(receiver)) return Segments{name};
        TSNode param = first_named_child(receiver, profile);
        if (ts_node_is_null(param)) return Segments{name};
        TSNode type = field(param, "type");
        while (!ts_node_is_null(type) && std::strcmp(ts_node_type(type), "pointer_type") == 0) {
            type = first_named_child(type, profile);
        }
        if (!ts_node_is_null(type) && std::strcmp(ts_node_type(type), "generic_type") == 0) {
            type = field(type, "type");
        }
        if (ts_node_is_null(type)) return Segments{name};
        return Segments{compact(node_text(type, src)), name};
    }
    case NameRule::AssignedOrAnonymous: {
        if (!rule.field.empty()) {
            TSNode own = field(node, rule.field);
            if (!ts_node_is_null(own)) return Segments{compact(node_text(own, src))};
        }
        TSNode parent = ts_node_parent(node);
        if (!ts_node_is_null(parent)) {
            for (const char* binding : {"name", "left", "key", "declarator", "property"}) {
                TSNode bound = field(parent, binding);
                if (ts_node_is_null(bound) || ts_node_eq(bound, node)) continue;
                std::string name = unquote(compact(node_text(bound, src)));
                if (!name.empty()) return Segments{name};
            }
        }
        return Segments{synthesized_name(node, rule, profile)};
    }
    case NameRule::FirstNamedChild: {
        TSNode child = first_named_child(node, profile);
        if (ts_node_is_null(child)) return std::nullopt;
        return Segments{compact(node_text(child, src))};
    }
    case NameRule::Decorator: {
        TSNode target = first_named_child(node, profile);
        if (ts_node_is_null(target)) return std::nullopt;
        const char* type = ts_node_type(target);
        if (std::strcmp(type, "call") == 0 || std::strcmp(type, "call_expression") == 0) {
            TSNode fn = field(target, "function");
            if (!ts_node_is_null(fn)) target = fn;
        }
        return Segments{compact(node_text(target, src))};
    }
    case NameRule::ExportTarget: {
        TSNode decl = field(node, "declaration");
        if (!ts_node_is_null(decl)) {
            TSNode name = field(decl, "name");
            if (!ts_node_is_null(name)) return Segments{compact(node_text(name, src))};
            uint32_t count = ts_node_named_child_count(decl);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(decl, i);
                if (std::strcmp(ts_node_type(child), "variable_declarator") != 0) continue;
                TSNode var = field(child, "name");
                if (!ts_node_is_null(var)) return Segments{compact(node_text(var, src))};
            }
            return Segments{synthesized_name(node, rule, profile)};
        }
        if (!ts_node_is_null(field(node, "value"))) return Segments{"default"};
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (std::strcmp(ts_node_type(child), "export_clause") == 0) return Segments{compact(node_text(child, src))};
        }
        TSNode source = field(node, "source");
        if (!ts_node_is_null(source)) return Segments{"*:" + unquote(node_text(source, src))};
        return Segments{synthesized_name(node, rule, profile)};
    }
    case NameRule::Docstring: {
        TSNode parent = ts_node_parent(node);
        if (ts_node_is_null(parent) || !profile.docstring_parents.count(ts_node_type(parent))) return std::nullopt;
        TSNode owner = ts_node_parent(parent);
        if (!ts_node_is_null(owner) && !profile.docstring_owners.count(ts_node_type(owner))) return std::nullopt;
        if (!ts_node_eq(first_named_child(parent, profile), node)) return std::nullopt;
        if (non_comment_named_children(node, profile) != 1) return std::nullopt;
        if (std::strcmp(ts_node_type(first_named_child(node, profile)), "string") != 0) return std::nullopt;
        return Segments{"__doc__"};
    }
    }
    return std::nullopt;
}

struct SignatureScan {
    std::string text;
    int branches = 0;
};

void append_token(std::string& out, const std::string& token) {
    if (token.empty()) return;
    if (!out.empty()) out += ' ';
    out += token;
}

// Leaf tokens of the subtree with comments dropped. Nested scopes are left out
// entirely; they carry their own facts.
SignatureScan scan_signature(TSNode root, const LanguageProfile& profile, const std::string& src) {
    SignatureScan scan;
    std::vector<TSNode> stack{root};
    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();
        const char* type = ts_node_type(node);
        if (profile.is_comment(type)) continue;

        if (!ts_node_eq(node, root) && ts_node_is_named(node)) {
            const NodeRule* rule = profile.rule_for(type);
            if (rule && rule->opens_scope && resolve_name(node, *rule, profile, src)) continue;
        }
        if (ts_node_is_named(node) && profile.is_branch(type)) ++scan.branches;

        uint32_t count = ts_node_child_count(node);
        if (count == 0) {
            append_token(scan.text, node_text(node, src));
            continue;
        }
        for (uint32_t i = count; i > 0; --i) stack.push_back(ts_node_child(node, i - 1));
    }
    return scan;
}

std::optional<std::string> first_string_argument(TSNode call, const LanguageProfile& profile, const std::string& src) {
    TSNode args = field(call, "arguments");
    if (ts_node_is_null(args)) return std::nullopt;
    TSNode first = first_named_child(args, profile);
    if (ts_node_is_null(first)) return std::nullopt;
    const char* type = ts_node_type(first);
    if (std::strcmp(type, "string") != 0 && std::strcmp(type, "template_string") != 0) return std::nullopt;
    return unquote(node_text(first, src));
}

Span span_of(TSNode node) {
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    return Span{start.row + 1, start.column, end.row + 1, end.column};
}

} // namespace

std::vector<std::string> FactExtractor::module_segments(const std::string& file_path, const std::string& language) {
    fs::path p(file_path);
    if (language == "python" && p.filename() == "__init__.py") {
        p = p.parent_path();
    } else {
        p.replace_extension();
    }

    std::vector<std::string> segments;
    for (const auto& part : p) {
        std::string s = part.string();
        if (s.empty() || s == "." || s == "/") continue;
        segments.push_back(s);
    }
    if (segments.empty()) segments.push_back(fs::path(file_path).stem().string());
    return segments;
}

std::vector<Fact> FactExtractor::extract(const syntax::SyntaxTree& tree, const std::string& file_path) const {
    const LanguageProfile& profile = *tree.language();
    const std::string& src = tree.source();
    std::vector<Fact> facts;
    std::vector<std::string> scope = module_segments(file_path, profile.name);

    struct Frame {
        TSNode node;
        size_t depth;
    };
    std::vector<Frame> stack{{tree.root(), scope.size()}};

    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();
        scope.resize(frame.depth);

        if (const NodeRule* rule = profile.rule_for(ts_node_type(frame.node))) {
            if (auto name = resolve_name(frame.node, *rule, profile, src)) {
                SignatureScan scan = scan_signature(frame.node, profile, src);
                // A call is fingerprinted by its callee; its arguments belong to the caller
                if (rule->kind == kinds::reference) scan.text = join_segments(*name, ".");

                Fact fact;
                fact.kind = rule->kind;
                fact.qualified_name = scope;
                fact.qualified_name.insert(fact.qualified_name.end(), name->begin(), name->end());
                fact.file_path = file_path;
                fact.language = profile.name;
                fact.span = span_of(frame.node);
                fact.signature_text = std::move(scan.text);
                if (rule->kind == kinds::definition) fact.complexity = 1 + scan.branches;
                facts.push_back(fact);

                if (rule->kind == kinds::definition && !profile.test_prefix.empty() &&
                    name->back().rfind(profile.test_prefix, 0) == 0) {
                    Fact test = fact;
                    test.kind = kinds::test_case;
                    test.signature_text = name->back();
                    test.complexity.reset();
                    facts.push_back(std::move(test));
                }
                if (rule->kind == kinds::reference && profile.test_calls.count(name->back())) {
                    if (auto label = first_string_argument(frame.node, profile, src)) {
                        Fact test = fact;
                        test.kind = kinds::test_case;
                        test.qualified_name = scope;
                        test.qualified_name.push_back(*label);
                        test.signature_text = *label;
                        facts.push_back(std::move(test));
                    }
                }

                if (rule->opens_scope) scope.insert(scope.end(), name->begin(), name->end());
            }
        }

        uint32_t count = ts_node_named_child_count(frame.node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push_back({ts_node_named_child(frame.node, i - 1), scope.size()});
        }
    }
    return facts;
}

} // namespace code_facts
