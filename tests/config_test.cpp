#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "../src/app/config.hpp"
#include "../src/app/settings/store.hpp"
#include "../src/logger.hpp"

namespace fs = std::filesystem;
using app::settings::Config;
using app::settings::Store;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger::set_console(false);
        logger::set_level(logger::Level::Info);
        logger::clear();
        dir = fs::temp_directory_path() /
              ("dlid_config_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string path(const std::string& name) const { return (dir / name).string(); }

    fs::path dir;
};

} // namespace

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Config cfg;
    cfg.chunk_size = 9;
    EXPECT_FALSE(Store::load(path("missing.json"), cfg));
    EXPECT_EQ(cfg.chunk_size, 0);
    EXPECT_EQ(cfg.output_format, "json");
    EXPECT_EQ(cfg.capture_timeout_ms, 200);
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config cfg;
    cfg.log_level = "warn";
    cfg.chunk_size = 4;
    cfg.output_format = "text";
    cfg.describe_fields = true;
    cfg.capture_timeout_ms = 500;
    ASSERT_TRUE(app::settings::store::save_to(path("sub/dlid.json"), cfg));

    Config loaded;
    ASSERT_TRUE(app::settings::store::load_from(path("sub/dlid.json"), loaded));
    EXPECT_EQ(loaded.log_level, "warn");
    EXPECT_EQ(loaded.chunk_size, 4);
    EXPECT_EQ(loaded.output_format, "text");
    EXPECT_TRUE(loaded.describe_fields);
    EXPECT_EQ(loaded.capture_timeout_ms, 500);
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    std::ofstream(path("partial.json")) << R"({"chunk_size": 3})";
    Config cfg;
    ASSERT_TRUE(Store::load(path("partial.json"), cfg));
    EXPECT_EQ(cfg.chunk_size, 3);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.indent, 2);
}

TEST_F(ConfigTest, MalformedFileFallsBackAndWarns) {
    std::ofstream(path("bad.json")) << "{ chunk_size: ";
    Config cfg;
    cfg.chunk_size = 7;
    EXPECT_FALSE(Store::load(path("bad.json"), cfg));
    EXPECT_EQ(cfg.chunk_size, 0);
    ASSERT_GE(logger::line_count(), 1u);
    EXPECT_NE(logger::lines().back().find("[WARN]"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypeFallsBack) {
    std::ofstream(path("type.json")) << R"({"chunk_size": "many"})";
    Config cfg;
    EXPECT_FALSE(Store::load(path("type.json"), cfg));
    EXPECT_EQ(cfg.chunk_size, 0);
}

TEST_F(ConfigTest, ApplyDefaultsClamps) {
    Config cfg;
    cfg.log_level = "loud";
    cfg.chunk_size = -4;
    cfg.output_format = "xml";
    cfg.capture_timeout_ms = 0;
    cfg.indent = -7;
    app::settings::apply_defaults(cfg);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.chunk_size, 0);
    EXPECT_EQ(cfg.output_format, "json");
    EXPECT_EQ(cfg.capture_timeout_ms, 200);
    EXPECT_EQ(cfg.indent, -1);
}

TEST_F(ConfigTest, EffectiveConfig) {
    Config s;
    s.log_level = "error";
    s.log_to_file = false;
    s.log_file = "x.log";
    s.output_format = "text";
    s.capture_timeout_ms = 300;

    app::config::AppConfig a = app::config::from_settings(s);
    EXPECT_EQ(a.log_level, logger::Level::Error);
    EXPECT_TRUE(a.log_file.empty());
    EXPECT_EQ(a.format, app::config::OutputFormat::Text);
    EXPECT_EQ(a.capture_timeout, std::chrono::milliseconds(300));

    s.log_to_file = true;
    EXPECT_EQ(app::config::from_settings(s).log_file, "x.log");

    Config back = app::config::to_settings(a);
    EXPECT_EQ(back.log_level, "error");
    EXPECT_EQ(back.output_format, "text");
    EXPECT_EQ(back.capture_timeout_ms, 300);
}

TEST_F(ConfigTest, OverridesWin) {
    app::config::AppConfig base;
    base.chunk_size = 8;
    base.describe_fields = true;

    app::config::Overrides o;
    o.format = app::config::OutputFormat::Text;
    o.chunk_size = 1;

    app::config::AppConfig m = app::config::merge(base, o);
    EXPECT_EQ(m.format, app::config::OutputFormat::Text);
    EXPECT_EQ(m.chunk_size, 1u);
    EXPECT_TRUE(m.describe_fields);
    EXPECT_FALSE(m.capture);
}
