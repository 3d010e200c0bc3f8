#include <gtest/gtest.h>

#include "parser/ast/node.hpp"
#include "parser/document/table.hpp"

using namespace parser;
using namespace parser::ast;
namespace make = parser::ast::make;

namespace {

Node quote_table() {
    return make::table({"场合", "台词"}, {
        make::row(std::vector<std::string>{"场合", "台词"}),
        make::row(std::vector<std::string>{"", " "}),
        make::row(std::vector<std::string>{"日常", "你好"}),
        make::row(std::vector<std::string>{"战斗"}),
        make::row(std::vector<std::string>{" 胜利 ", " 赢了！ "}),
    });
}

} // namespace

TEST(TableText, BodyRowsBecomePipeLines) {
    Node t = make::table({"h1", "h2"}, {
        make::row(std::vector<std::string>{" a ", "b"}),
        make::row(std::vector<std::string>{"c", ""}),
    });
    // head cells are not wrapped in a row and are not emitted
    EXPECT_EQ(document::to_text(t), "| a | b |\n| c |  |");
}

TEST(TableText, RowsInsideHeadAreEmitted) {
    Node head = make::node(NodeKind::TableHead, {make::row(std::vector<std::string>{"k", "v"})});
    Node body = make::node(NodeKind::TableBody, {make::row(std::vector<std::string>{"1", "2"})});
    Node t = make::node(NodeKind::Table, {head, body});
    EXPECT_EQ(document::to_text(t), "| k | v |\n| 1 | 2 |");
}

TEST(TableText, EmptyTable) {
    EXPECT_EQ(document::to_text(make::node(NodeKind::Table)), "");
}

TEST(TableRecords, SkipsHeaderRepeatsBlankAndShortRows) {
    auto rows = document::to_records(quote_table());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (document::QuoteEntry{"日常", "你好"}));
    EXPECT_EQ(rows[1], (document::QuoteEntry{"胜利", "赢了！"}));
}

TEST(TableRecords, OnlyTheLabelMarksAHeaderRepeat) {
    Node t = make::table({"时机", "内容"}, {
        make::row(std::vector<std::string>{"时机", "内容"}),
        make::row(std::vector<std::string>{"登场", "来了"}),
    });
    auto rows = document::to_records(t);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (document::QuoteEntry{"时机", "内容"}));
    EXPECT_EQ(rows[1].occasion, "登场");
}

TEST(TableRecords, HeaderTextsReadDirectCellsAndRows) {
    EXPECT_EQ(document::header_texts(quote_table()), (std::vector<std::string>{"场合", "台词"}));
    Node head = make::node(NodeKind::TableHead, {make::row(std::vector<std::string>{"x", "y"})});
    EXPECT_EQ(document::header_texts(make::node(NodeKind::Table, {head})), (std::vector<std::string>{"x", "y"}));
}

TEST(TableRecords, CustomLabel) {
    Node t = make::table({}, {
        make::row(std::vector<std::string>{"Occasion", "Line"}),
        make::row(std::vector<std::string>{"Idle", "Hi"}),
    });
    auto rows = document::to_records(t, "Occasion");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].line, "Hi");
}
