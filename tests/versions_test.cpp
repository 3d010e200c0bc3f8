#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser/ast/node.hpp"
#include "parser/document/versions.hpp"

using namespace parser;
using namespace parser::ast;
namespace make = parser::ast::make;

namespace {

Node quotes(std::vector<Node> rows) {
    return make::table({"场合", "台词"}, std::move(rows));
}

} // namespace

TEST(Quotes, RecordsPerVersion) {
    std::vector<Node> nodes = {
        make::heading(3, "默认"),
        quotes({
            make::row(std::vector<std::string>{"场合", "台词"}),
            make::row(std::vector<std::string>{"", ""}),
            make::row(std::vector<std::string>{"日常", "你好"}),
        }),
        make::paragraph("between tables"),
        quotes({make::row(std::vector<std::string>{"战斗", "上吧"})}),
        make::heading(3, "泳装"),
        quotes({make::row(std::vector<std::string>{"日常", "好热"})}),
    };
    auto book = document::parse_quotes(nodes);
    ASSERT_EQ(book.size(), 2u);
    EXPECT_EQ(book[0].first, "默认");
    ASSERT_EQ(book[0].second.size(), 2u);
    EXPECT_EQ(book[0].second[0], (document::QuoteEntry{"日常", "你好"}));
    EXPECT_EQ(book[0].second[1], (document::QuoteEntry{"战斗", "上吧"}));
    EXPECT_EQ(book[1].first, "泳装");
    EXPECT_EQ(book[1].second.size(), 1u);
}

TEST(Quotes, TablesBeforeFirstVersionAreIgnored) {
    std::vector<Node> nodes = {
        quotes({make::row(std::vector<std::string>{"日常", "孤儿"})}),
        make::heading(3, "默认"),
    };
    auto book = document::parse_quotes(nodes);
    ASSERT_EQ(book.size(), 1u);
    EXPECT_TRUE(book[0].second.empty());
}

TEST(Quotes, RepeatedVersionStartsOver) {
    std::vector<Node> nodes = {
        make::heading(3, "默认"), quotes({make::row(std::vector<std::string>{"a", "1"})}),
        make::heading(3, "默认"), quotes({make::row(std::vector<std::string>{"b", "2"})}),
    };
    auto book = document::parse_quotes(nodes);
    ASSERT_EQ(book.size(), 1u);
    ASSERT_EQ(book[0].second.size(), 1u);
    EXPECT_EQ(book[0].second[0].occasion, "b");
}

TEST(VersionedBlocks, CollectsParagraphsAndTables) {
    std::vector<Node> nodes = {
        make::paragraph("before"),
        make::heading(3, "v1"),
        make::paragraph("stats"),
        make::table({"k", "v"}, {make::row(std::vector<std::string>{"HP", "100"})}),
        make::list({"lists are not collected"}),
        make::heading(3, "empty"),
        make::heading(3, "v2"),
        make::paragraph("more"),
    };
    auto out = document::parse_versioned_blocks(nodes);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].first, "v1");
    EXPECT_EQ(out[0].second, (std::vector<std::string>{"stats", "| HP | 100 |"}));
    EXPECT_EQ(out[1].first, "v2");
    EXPECT_EQ(out[1].second, (std::vector<std::string>{"more"}));
}
