#include "parser_pool.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stack>

namespace code_facts::syntax {

SyntaxTree::SyntaxTree(TSTree* tree, std::string source, LanguageHandle language)
    : tree_(tree), source_(std::move(source)), language_(language) {}

std::string SyntaxTree::to_sexp() const {
    char* raw = ts_node_string(root());
    std::string out = raw ? raw : "";
    std::free(raw);
    return out;
}

namespace {

// First ERROR or MISSING node in pre-order, descending only into subtrees that hold one
TSNode first_error(TSNode root) {
    std::stack<TSNode> stack;
    stack.push(root);
    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();
        if (ts_node_is_error(node) || ts_node_is_missing(node)) return node;
        if (!ts_node_has_error(node)) continue;

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push(ts_node_child(node, i - 1));
        }
    }
    return root;
}

} // namespace

ParserPool::~ParserPool() {
    for (TSParser* parser : idle_) ts_parser_delete(parser);
}

TSParser* ParserPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            TSParser* parser = idle_.back();
            idle_.pop_back();
            return parser;
        }
    }
    return ts_parser_new();
}

void ParserPool::release(TSParser* parser) {
    ts_parser_reset(parser);
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(parser);
}

ParseResult ParserPool::parse(LanguageHandle language, std::string source) {
    ParseResult result;
    TSParser* parser = acquire();

    if (!ts_parser_set_language(parser, language->grammar())) {
        release(parser);
        result.failure = ParseFailure{"grammar for " + language->name + " has an incompatible ABI version", {}, {}};
        return result;
    }

    TSTree* tree = ts_parser_parse_string(parser, nullptr, source.c_str(), static_cast<uint32_t>(source.length()));
    release(parser);

    if (!tree) {
        result.failure = ParseFailure{"parser produced no tree", {}, {}};
        return result;
    }

    TSNode root = ts_tree_root_node(tree);
    if (ts_node_has_error(root)) {
        TSNode bad = first_error(root);
        TSPoint at = ts_node_start_point(bad);
        std::string what = ts_node_is_missing(bad)
            ? std::string("missing ") + ts_node_type(bad)
            : std::string("syntax error");
        result.failure = ParseFailure{what, at.row + 1, at.column};
        ts_tree_delete(tree);
        return result;
    }

    result.tree = std::make_unique<SyntaxTree>(tree, std::move(source), language);
    return result;
}

} // namespace code_facts::syntax
