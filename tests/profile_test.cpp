#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser/ast/node.hpp"
#include "parser/document/profile.hpp"

using namespace parser;
using namespace parser::ast;
namespace make = parser::ast::make;

namespace {

document::ProfileRules student_rules() {
    document::ProfileRules rules;
    rules.header_labels = {"学生档案", "基本资料"};
    rules.relation_key = "相关人物";
    return rules;
}

Node relation_cell() {
    return make::cell({make::link("A"), make::text("、"), make::link("B"), make::link("C（注）")});
}

} // namespace

TEST(Profile, RelationRowsFuseIntoNameList) {
    Document doc = {make::table({"学生档案", ""}, {
        make::row(std::vector<std::string>{"全名", "某某"}),
        make::row(std::vector<std::string>{"相关人物", ""}),
        make::row(std::vector<Node>{relation_cell()}),
        make::row(std::vector<std::string>{"年龄", "16"}),
    })};
    auto p = document::extract_profile(doc, student_rules());

    ASSERT_NE(p.get("相关人物"), nullptr);
    EXPECT_EQ(*p.get("相关人物"), "A,B");
    EXPECT_EQ(p.relation_names, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(p.relation_key, "相关人物");
    ASSERT_EQ(p.fields.size(), 3u);
    EXPECT_EQ(p.fields[0].first, "全名");
    EXPECT_EQ(p.fields[2].first, "年龄");
    EXPECT_EQ(p.fields[2].second, "16");
}

TEST(Profile, HeaderRowsAndEmptyValuesAreSkipped) {
    Document doc = {make::table({}, {
        make::row(std::vector<std::string>{"基本资料", ""}),
        make::row(std::vector<std::string>{"", "orphan value"}),
        make::row(std::vector<std::string>{"校长", ""}),
        make::row(std::vector<std::string>{"所在地", "某市"}),
        make::row(std::vector<std::string>{"单格"}),
    })};
    auto p = document::extract_profile(doc, student_rules());
    ASSERT_EQ(p.fields.size(), 1u);
    EXPECT_EQ(*p.get("所在地"), "某市");
    EXPECT_EQ(p.get("校长"), nullptr);
}

TEST(Profile, LaterWriteReplacesInPlace) {
    Document doc = {make::table({}, {
        make::row(std::vector<std::string>{"a", "1"}),
        make::row(std::vector<std::string>{"b", "2"}),
        make::row(std::vector<std::string>{"a", "3"}),
    })};
    auto p = document::extract_profile(doc, {});
    ASSERT_EQ(p.fields.size(), 2u);
    EXPECT_EQ(p.fields[0].first, "a");
    EXPECT_EQ(p.fields[0].second, "3");
}

TEST(Profile, RelationKeyOnLastRowIsOrdinary) {
    Document doc = {make::table({}, {make::row(std::vector<std::string>{"相关人物", "X"})})};
    auto p = document::extract_profile(doc, student_rules());
    EXPECT_EQ(*p.get("相关人物"), "X");
    EXPECT_TRUE(p.relation_names.empty());
}

TEST(Profile, OnlyFirstTableIsRead) {
    Document doc = {
        make::paragraph("intro"),
        make::table({}, {make::row(std::vector<std::string>{"first", "1"})}),
        make::table({}, {make::row(std::vector<std::string>{"second", "2"})}),
    };
    auto p = document::extract_profile(doc, {});
    EXPECT_NE(p.get("first"), nullptr);
    EXPECT_EQ(p.get("second"), nullptr);
}

TEST(Profile, NoTableGivesEmptyProfile) {
    Document doc = {make::heading(2, "A"), make::paragraph("b")};
    EXPECT_TRUE(document::extract_profile(doc, student_rules()).empty());
}

TEST(Profile, CellsReadRawPayload) {
    Node code = make::other("codespan");
    code.raw = "v1.0";
    Document doc = {make::table({}, {make::row(std::vector<Node>{make::cell("版本"), make::cell({code})})})};
    EXPECT_EQ(*document::extract_profile(doc, {}).get("版本"), "v1.0");
}

TEST(RelationNames, PlainTextIsSplitOnCommas) {
    Node cell = make::cell({make::text("甲、乙, 丙"), make::strong({make::link("丁")}), make::text("备注：无")});
    EXPECT_EQ(document::extract_relation_names(cell), (std::vector<std::string>{"甲", "乙", "丙", "丁"}));
}

TEST(RelationNames, AsciiAnnotationsAndEmptyLinksDropped) {
    Node cell = make::cell({make::link("E(note)"), make::link(""), make::link("F")});
    EXPECT_EQ(document::extract_relation_names(cell), (std::vector<std::string>{"F"}));
}
