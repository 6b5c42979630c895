#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "../src/app/output.hpp"
#include "../src/dlid/mod.hpp"
#include "../src/logger.hpp"
#include "test_payload.hpp"

namespace {

dlid::ParseResult sample() {
    logger::set_console(false);
    dlid::Parser parser(testdata::example());
    return parser.parse();
}

} // namespace

TEST(Output, JsonShape) {
    nlohmann::json j = app::output::result_json(sample());
    EXPECT_EQ(j["header"]["iin"], "636000");
    EXPECT_EQ(j["header"]["segment_terminator"], "\r");
    EXPECT_EQ(j["header"]["num_entries"], 2);
    ASSERT_EQ(j["subfile_designators"].size(), 2u);
    EXPECT_EQ(j["subfile_designators"][1]["type"], "ZV");
    EXPECT_EQ(j["subfile_designators"][1]["offset"], 318);
    EXPECT_EQ(j["subfiles"]["DL"]["DAC"], "MICHAEL");
    EXPECT_FALSE(j["subfiles"].contains("ZV"));
}

TEST(Output, RenderJsonParsesBack) {
    const std::string s = app::output::render_json(sample(), -1);
    EXPECT_EQ(s.find('\n'), std::string::npos);
    nlohmann::json j = nlohmann::json::parse(s);
    EXPECT_EQ(j["subfiles"]["DL"]["DAG"], "2300 WEST BROAD STREET");
}

TEST(Output, CaptureJson) {
    nlohmann::json j = nlohmann::json::parse(app::output::render_capture_json({sample()}, "typed", 2));
    EXPECT_EQ(j["results"].size(), 1u);
    EXPECT_EQ(j["text"], "typed");
}

TEST(Output, TextWithDescriptions) {
    const std::string plain = app::output::render_text(sample(), false);
    EXPECT_NE(plain.find("IIN                  636000"), std::string::npos);
    EXPECT_NE(plain.find("Separators           0x0a 0x1e 0x0d"), std::string::npos);
    EXPECT_NE(plain.find("Subfile ZV @318 +8 (not parsed)"), std::string::npos);
    EXPECT_NE(plain.find("DAQ T64235789\n"), std::string::npos);
    EXPECT_EQ(plain.find("Customer ID Number"), std::string::npos);

    const std::string described = app::output::render_text(sample(), true);
    EXPECT_NE(described.find("DAQ T64235789  # Customer ID Number"), std::string::npos);
}

TEST(Elements, Describe) {
    EXPECT_EQ(dlid::elements::describe("DCS"), "Customer Family Name");
    EXPECT_EQ(dlid::elements::describe("ZVA"), "");
}
