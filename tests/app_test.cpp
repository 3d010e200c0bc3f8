#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "app/app.hpp"
#include "app/config.hpp"
#include "logger.hpp"
#include "types.hpp"

namespace fs = std::filesystem;
using namespace app;

namespace {

const char* kStudentV1 = R"([
    {"type": "heading", "attrs": {"level": 2}, "children": [{"type": "text", "raw": "简介"}]},
    {"type": "paragraph", "children": [{"type": "text", "raw": "old"}]}
])";

const char* kStudentV2 = R"([
    {"type": "table", "children": [
        {"type": "table_head", "children": [{"type": "table_cell", "children": [{"type": "text", "raw": "学生档案"}]}]},
        {"type": "table_body", "children": [
            {"type": "table_row", "children": [
                {"type": "table_cell", "children": [{"type": "text", "raw": "全名"}]},
                {"type": "table_cell", "children": [{"type": "text", "raw": "某某"}]}
            ]}
        ]}
    ]},
    {"type": "heading", "attrs": {"level": 2}, "children": [{"type": "text", "raw": "简介"}]},
    {"type": "paragraph", "children": [{"type": "text", "raw": "new"}]}
])";

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("wikidigest_app_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "in");
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& name, const std::string& text) const {
        std::ofstream out(root_ / "in" / name, std::ios::binary);
        out << text;
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    config::AppConfig make_config(int workers = 2) const {
        config::AppConfig cfg;
        cfg.kind = types::EntityKind::Student;
        cfg.input_dir = (root_ / "in").string();
        cfg.output_dir = (root_ / "out").string();
        cfg.workers = workers;
        config::apply_defaults(cfg);
        return cfg;
    }

    fs::path root_;
};

} // namespace

TEST_F(AppTest, ProcessesLatestRevisionOfEachEntity) {
    write("某某_1.json", kStudentV1);
    write("某某_12.json", kStudentV2);
    write("初音未来_3.json", kStudentV2);
    write("坏的_2.json", "{not json");
    write("notes.txt", "ignored");

    App application(make_config());
    ASSERT_EQ(application.run(), 0);

    const auto& results = application.results();
    ASSERT_EQ(results.size(), 3u);
    int saved = 0, skipped = 0, failed = 0;
    for (const auto& r : results) {
        if (r.outcome == App::Outcome::Saved) ++saved;
        if (r.outcome == App::Outcome::Skipped) ++skipped;
        if (r.outcome == App::Outcome::Failed) ++failed;
    }
    EXPECT_EQ(saved, 1);
    EXPECT_EQ(skipped, 1);
    EXPECT_EQ(failed, 1);

    const fs::path out = root_ / "out" / "某某.json";
    ASSERT_TRUE(fs::exists(out));
    auto j = nlohmann::json::parse(read(out));
    EXPECT_EQ(j["简介"][0], "new");
    EXPECT_EQ(j["学生档案"]["全名"], "某某");
    EXPECT_TRUE(j.contains("角色台词"));
    EXPECT_FALSE(fs::exists(root_ / "out" / "初音未来.json"));
    EXPECT_FALSE(fs::exists(root_ / "out" / "某某.txt"));
}

TEST_F(AppTest, WritesIndexTextWhenAsked) {
    write("某某_5.json", kStudentV2);
    config::AppConfig cfg = make_config(1);
    cfg.write_index_text = true;

    App application(cfg);
    ASSERT_EQ(application.run(), 0);
    const std::string text = read(root_ / "out" / "某某.txt");
    EXPECT_EQ(text.rfind("名称: 某某", 0), 0u);
    EXPECT_NE(text.find("简介:\nnew"), std::string::npos);
}

TEST_F(AppTest, MissingInputFolderIsFatal) {
    config::AppConfig cfg = make_config();
    cfg.input_dir = (root_ / "absent").string();
    App application(cfg);
    EXPECT_EQ(application.run(), 1);
}

TEST_F(AppTest, NoSelectableDocumentsIsFatal) {
    write("readme.md", "nothing");
    App application(make_config());
    EXPECT_EQ(application.run(), 1);
    EXPECT_TRUE(application.results().empty());
}
