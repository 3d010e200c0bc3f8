#include <gtest/gtest.h>

#include "parser/ast/node.hpp"
#include "parser/document/text.hpp"
#include "parser/parser.hpp"

using namespace parser;
using namespace parser::ast;
namespace make = parser::ast::make;

TEST(Flatten, TextReturnsRawVerbatim) {
    EXPECT_EQ(document::flatten(make::text("  a b  ")), "  a b  ");
}

TEST(Flatten, InlineChildrenConcatenateInOrder) {
    Node p = make::paragraph({make::text("Hello "), make::strong({make::text("big ")}),
                              make::emphasis({make::text("wide ")}), make::link("world")});
    EXPECT_EQ(document::flatten(p), "Hello big wide world");
}

TEST(Flatten, ImageTitleWinsOverChildren) {
    EXPECT_EQ(document::flatten(make::image(std::string("Logo"), {make::text("alt")})), "Logo");
    EXPECT_EQ(document::flatten(make::image(std::string(""), {make::text("alt")})), "alt");
    EXPECT_EQ(document::flatten(make::image(std::nullopt, {make::text("alt")})), "alt");
}

TEST(Flatten, EveryKindYieldsAString) {
    const NodeKind kinds[] = {
        NodeKind::Heading, NodeKind::Paragraph, NodeKind::Strong, NodeKind::Emphasis, NodeKind::Link,
        NodeKind::Image, NodeKind::List, NodeKind::ListItem, NodeKind::Table, NodeKind::TableHead,
        NodeKind::TableBody, NodeKind::TableRow, NodeKind::TableCell, NodeKind::Other,
    };
    for (NodeKind k : kinds) {
        EXPECT_EQ(document::flatten(make::node(k)), "") << kind_name(k);
        EXPECT_EQ(document::flatten(make::node(k, {make::text("x")})), "x") << kind_name(k);
    }
}

TEST(Flatten, UnknownNodesUseChildren) {
    Node n = make::other("block_text", {make::text("inside")});
    EXPECT_EQ(document::flatten(n), "inside");
}

TEST(Flatten, RawPolicyPrefersRawPayload) {
    Node code = make::other("codespan");
    code.raw = "x = 1";
    Node cell = make::cell({make::text("v: "), code, make::image(std::string("T"), {make::text("alt")})});
    EXPECT_EQ(document::flatten(cell, document::FlattenPolicy::Raw), "v: x = 1alt");
    EXPECT_EQ(document::flatten(cell, document::FlattenPolicy::Rendered), "v: T");
}

TEST(Flatten, TrimmedStripsWideBlanks) {
    Node p = make::paragraph("\xE3\x80\x80  text \xC2\xA0");
    EXPECT_EQ(document::flatten_trimmed(p), "text");
}

TEST(FlattenList, JoinsTrimmedItems) {
    Node l = make::list({" one ", "two", ""});
    EXPECT_EQ(document::list_items(l), (std::vector<std::string>{"one", "two", ""}));
    EXPECT_EQ(document::flatten_list(l), "one\ntwo\n");
}

TEST(StringHelpers, SplitKeepsEmptyPieces) {
    EXPECT_EQ(split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split("", ','), (std::vector<std::string>{""}));
}

TEST(StringHelpers, OrderedUpsertKeepsFirstPosition) {
    Ordered<int> m;
    upsert(m, "b") = 1;
    upsert(m, "a") = 2;
    upsert(m, "b") = 3;
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0].first, "b");
    EXPECT_EQ(m[0].second, 3);
    EXPECT_EQ(*lookup(m, "a"), 2);
    EXPECT_EQ(lookup(m, "c"), nullptr);
}
