#pragma once
#include <tree_sitter/api.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "language_registry.hpp"

namespace code_facts {
    namespace syntax {

// A parsed file. Owns the tree-sitter tree and the bytes it was parsed from.
class SyntaxTree {
public:
    SyntaxTree(TSTree* tree, std::string source, LanguageHandle language);

    TSNode root() const { return ts_tree_root_node(tree_.get()); }
    const std::string& source() const { return source_; }
    LanguageHandle language() const { return language_; }

    // S-expression of the whole tree (structural comparisons in tests)
    std::string to_sexp() const;

private:
    struct TreeDeleter {
        void operator()(TSTree* t) const { if (t) ts_tree_delete(t); }
    };
    std::unique_ptr<TSTree, TreeDeleter> tree_;
    std::string source_;
    LanguageHandle language_;
};

struct ParseFailure {
    std::string message;
    std::optional<uint32_t> line;    // 1-based
    std::optional<uint32_t> column;  // 0-based
};

struct ParseResult {
    std::unique_ptr<SyntaxTree> tree;
    std::optional<ParseFailure> failure;

    bool ok() const { return tree != nullptr; }
};

// Hands out idle TSParsers so `parse` can run from many worker threads at once.
class ParserPool {
public:
    ParserPool() = default;
    ~ParserPool();
    ParserPool(const ParserPool&) = delete;
    ParserPool& operator=(const ParserPool&) = delete;

    ParseResult parse(LanguageHandle language, std::string source);

private:
    TSParser* acquire();
    void release(TSParser* parser);

    std::mutex mutex_;
    std::vector<TSParser*> idle_;
};

    }
}
