#include <gtest/gtest.h>

#include "command.hpp"
#include "test_helpers.hpp"

#include <set>

using namespace dombridge;

TEST(Command, EncodeFlattensArgumentsAndTagsSource) {
    Command command;
    command.action = "click";
    command.request_id = "abc";
    command.source = CommandSource::Ui;
    command.arguments = {{"selector", "#submit"}, {"source", "spoofed"}};

    nlohmann::json wire = encode_command(command);

    EXPECT_EQ(wire["type"], "dom_operation");
    EXPECT_EQ(wire["action"], "click");
    EXPECT_EQ(wire["selector"], "#submit");
    EXPECT_EQ(wire["request_id"], "abc");
    EXPECT_EQ(wire["source"], "ui");
}

TEST(Command, SourceNamesRoundTrip) {
    EXPECT_EQ(parse_source("mcp"), CommandSource::Mcp);
    EXPECT_EQ(parse_source("ui"), CommandSource::Ui);
    EXPECT_FALSE(parse_source("gui").has_value());
}

TEST(Command, MintedIdsAreDistinctUuids) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = mint_request_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(Command, ResultAccessorsPreferEchoedCommand) {
    nlohmann::json envelope = make_result("echoed", "mcp", {{"url", "https://example.com"}});
    envelope["request_id"] = "top-level";

    EXPECT_EQ(result_request_id(envelope), "echoed");
    EXPECT_EQ(result_source(envelope), CommandSource::Mcp);
    EXPECT_EQ(result_body(envelope)["url"], "https://example.com");
}

TEST(Command, ResultAccessorsFallBack) {
    nlohmann::json envelope = {{"type", "dom_operation_result"}, {"request_id", "top"}, {"title", "t"}};

    EXPECT_EQ(result_request_id(envelope), "top");
    EXPECT_FALSE(result_source(envelope).has_value());
    EXPECT_EQ(result_body(envelope)["title"], "t");
}
