// ============================================================
// test_endpoint.cpp -- Endpoint parsing and selection
// ============================================================

#include "client/endpoint.hpp"
#include "client/prompter.hpp"
#include "common/errors.hpp"
#include "common/protocol.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

using testing_util::ScriptedPrompter;

TEST(ParseEndpoint, StripsPrefixAndUsesWellKnownPort) {
    Endpoint ep = parse_endpoint("tcp:192.168.1.106");
    EXPECT_EQ("192.168.1.106", ep.host);
    EXPECT_EQ(4299, ep.port);
    EXPECT_EQ(RECEIVER_PORT, ep.port);
    EXPECT_EQ("tcp:192.168.1.106", ep.raw);
    EXPECT_EQ("192.168.1.106:4299", ep.str());
}

TEST(ParseEndpoint, KeepsHostNamesAsIs) {
    Endpoint ep = parse_endpoint("tcp:wii.local");
    EXPECT_EQ("wii.local", ep.host);
}

TEST(ParseEndpoint, MissingPrefixIsConfigurationError) {
    EXPECT_THROW(parse_endpoint("192.168.1.106"), ConfigurationError);
    EXPECT_THROW(parse_endpoint("udp:192.168.1.106"), ConfigurationError);
    EXPECT_THROW(parse_endpoint("TCP:192.168.1.106"), ConfigurationError);
    EXPECT_THROW(parse_endpoint(""), ConfigurationError);
}

TEST(ParseEndpoint, PrefixWithoutHostIsConfigurationError) {
    EXPECT_THROW(parse_endpoint("tcp:"), ConfigurationError);
}

TEST(ParseEndpoint, PortOverride) {
    EXPECT_EQ(5000, parse_endpoint("tcp:10.0.0.2", 5000).port);
    EXPECT_THROW(parse_endpoint("tcp:10.0.0.2", 0), ConfigurationError);
}

TEST(SelectEndpoint, CommandLineBeatsEnvironment) {
    ScriptedPrompter p;
    EndpointSources src{"tcp:1.1.1.1", "tcp:2.2.2.2", true};
    EXPECT_EQ("tcp:1.1.1.1", select_endpoint(src, p));
    EXPECT_TRUE(p.questions.empty());
}

TEST(SelectEndpoint, EnvironmentUsedWhenNoOption) {
    ScriptedPrompter p;
    EndpointSources src{"", "tcp:2.2.2.2", true};
    EXPECT_EQ("tcp:2.2.2.2", select_endpoint(src, p));
    EXPECT_TRUE(p.questions.empty());
}

TEST(SelectEndpoint, EmptyEnvironmentIsRejectedNotPrompted) {
    ScriptedPrompter p;
    p.answer_confirm(true).answer_ask("192.168.0.9");
    EndpointSources src{"", "", true};
    std::string raw = select_endpoint(src, p);
    EXPECT_EQ("", raw);
    EXPECT_TRUE(p.questions.empty());
    EXPECT_THROW(parse_endpoint(raw), ConfigurationError);
}

TEST(SelectEndpoint, AsksForAddressAndAddsPrefix) {
    ScriptedPrompter p;
    p.answer_confirm(true).answer_ask("192.168.0.9");
    EXPECT_EQ("tcp:192.168.0.9", select_endpoint(EndpointSources{}, p));
    EXPECT_EQ(2u, p.questions.size());
}

TEST(SelectEndpoint, DeclinedPromptIsConfigurationError) {
    ScriptedPrompter p;
    p.answer_confirm(false);
    EXPECT_THROW(select_endpoint(EndpointSources{}, p), ConfigurationError);
}

TEST(SelectEndpoint, EmptyAnswerIsConfigurationError) {
    ScriptedPrompter p;
    p.answer_confirm(true).answer_ask("");
    EXPECT_THROW(select_endpoint(EndpointSources{}, p), ConfigurationError);
}

TEST(SelectEndpoint, NonInteractiveNeverPrompts) {
    ScriptedPrompter p(false);
    EXPECT_THROW(select_endpoint(EndpointSources{}, p), ConfigurationError);
    EXPECT_TRUE(p.questions.empty());
}

TEST(ConsolePrompter, RepeatsUntilYesOrNo) {
    std::istringstream in("maybe\n  YES \n");
    std::ostringstream out;
    ConsolePrompter p(in, out, true);
    EXPECT_TRUE(p.confirm("Continue?"));
    // asked twice
    std::string shown = out.str();
    EXPECT_NE(std::string::npos, shown.find("Continue? [y/n]: Continue? [y/n]: "));
}

TEST(ConsolePrompter, EndOfInputDeclines) {
    std::istringstream in("");
    std::ostringstream out;
    ConsolePrompter p(in, out, true);
    EXPECT_FALSE(p.confirm("Continue?"));
    EXPECT_EQ("", p.ask("Address: "));
}

TEST(ConsolePrompter, AskTrimsAnswer) {
    std::istringstream in("  10.0.0.7\t\n");
    std::ostringstream out;
    ConsolePrompter p(in, out, true);
    EXPECT_EQ("10.0.0.7", p.ask("Address: "));
}
