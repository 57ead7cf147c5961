// =============================================================================
// Parser pool: tree-sitter parsing and failure reporting
// =============================================================================

#include <gtest/gtest.h>
#include <future>
#include <string>
#include <vector>
#include "language_registry.hpp"
#include "parser_pool.hpp"

using namespace code_facts::syntax;

class ParserPoolTest : public ::testing::Test {
protected:
    ParserPool pool;

    LanguageHandle language(const std::string& name) {
        auto handle = GrammarRegistry::instance().by_name(name);
        EXPECT_TRUE(handle.has_value()) << name;
        return *handle;
    }
};

TEST_F(ParserPoolTest, ParsesValidPython) {
    auto result = pool.parse(language("python"), "def foo(x):\n    return x + 1\n");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_STREQ(ts_node_type(result.tree->root()), "module");
    EXPECT_EQ(result.tree->language()->name, "python");
    EXPECT_EQ(result.tree->source(), "def foo(x):\n    return x + 1\n");
}

TEST_F(ParserPoolTest, EmptySourceIsValid) {
    auto result = pool.parse(language("go"), "");
    EXPECT_TRUE(result.ok());
}

TEST_F(ParserPoolTest, SyntaxErrorReportsLocation) {
    auto result = pool.parse(language("python"), "def broken(:\n    pass\n");
    ASSERT_FALSE(result.ok());
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_FALSE(result.failure->message.empty());
    ASSERT_TRUE(result.failure->line.has_value());
    EXPECT_EQ(*result.failure->line, 1u);
    EXPECT_TRUE(result.failure->column.has_value());
}

TEST_F(ParserPoolTest, SameInputSameTree) {
    const std::string src = "class A {\n  run() { return [1, 2].map(x => x * 2); }\n}\n";
    auto first = pool.parse(language("javascript"), src);
    auto second = pool.parse(language("javascript"), src);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.tree->to_sexp(), second.tree->to_sexp());
}

TEST_F(ParserPoolTest, CppErrorIsAFailure) {
    EXPECT_TRUE(pool.parse(language("cpp"), "int main() { return 0; }\n").ok());
    auto result = pool.parse(language("cpp"), "int main( { return 0; }\n");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.failure.has_value());
}

TEST_F(ParserPoolTest, ParsesFromManyThreads) {
    const std::string src = "package main\n\nfunc main() {\n\tprintln(\"hi\")\n}\n";
    LanguageHandle go = language("go");
    std::string expected = pool.parse(go, src).tree->to_sexp();

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [&]() {
            auto r = pool.parse(go, src);
            return r.ok() ? r.tree->to_sexp() : std::string("<failed>");
        }));
    }
    for (auto& r : results) EXPECT_EQ(r.get(), expected);
}
