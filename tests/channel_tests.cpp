#include <gtest/gtest.h>

#include "archive/channel.hpp"

namespace {

using namespace archive;

TEST(Channel, ParsesMediaAndParams) {
    const auto uri = parse_channel("aeron:udp?endpoint=localhost:40123|mtu=1408|term-length=65536");
    ASSERT_NE(uri, nullptr);
    EXPECT_EQ(uri->media(), "udp");
    EXPECT_EQ(uri->get("endpoint"), "localhost:40123");
    EXPECT_EQ(uri->get("mtu"), "1408");
    EXPECT_EQ(uri->get("interface"), "");
}

TEST(Channel, RejectsNonAeronChannels) {
    EXPECT_EQ(parse_channel("udp?endpoint=x"), nullptr);
    EXPECT_EQ(parse_channel("not-a-channel"), nullptr);
    EXPECT_NE(parse_channel("aeron:ipc"), nullptr);
}

TEST(Channel, StripKeepsOnlySourceIdentity) {
    const std::string stripped =
        strip_channel("aeron:udp?endpoint=localhost:40123|mtu=1408|term-length=65536|session-id=9");
    const auto uri = parse_channel(stripped);
    ASSERT_NE(uri, nullptr);
    EXPECT_EQ(uri->media(), "udp");
    EXPECT_EQ(uri->get("endpoint"), "localhost:40123");
    EXPECT_EQ(uri->get("session-id"), "9");
    EXPECT_EQ(uri->get("mtu"), "");
    EXPECT_EQ(uri->get("term-length"), "");

    EXPECT_EQ(strip_channel("aeron:ipc?term-length=65536"), "aeron:ipc");
    EXPECT_EQ(strip_channel("not-a-channel"), "");
}

TEST(Channel, StripIsStableAcrossTuningParams) {
    EXPECT_EQ(strip_channel("aeron:udp?endpoint=h:1|mtu=1408"), strip_channel("aeron:udp?endpoint=h:1|mtu=8192"));
}

TEST(Channel, SpyPrefixSurvivesStripping) {
    const std::string stripped = strip_channel("aeron-spy:aeron:udp?endpoint=h:1|mtu=1408");
    ASSERT_FALSE(stripped.empty());
    const auto uri = parse_channel(stripped);
    ASSERT_NE(uri, nullptr);
    EXPECT_EQ(uri->prefix(), "aeron-spy");
    EXPECT_EQ(uri->get("endpoint"), "h:1");
    EXPECT_NE(stripped, strip_channel("aeron:udp?endpoint=h:1"));
}

TEST(Channel, ReplayChannelCarriesRecordingGeometry) {
    RecordingDescriptor d;
    d.initial_term_id = 100;
    d.term_buffer_length = 64 * 1024;
    d.mtu_length = 1408;
    d.session_id = 77;

    const auto channel =
        make_replay_channel("aeron:udp?endpoint=replay:5000|term-id=1|session-id=3", d, 2LL * 64 * 1024 + 256);
    ASSERT_TRUE(channel.has_value());
    const auto uri = parse_channel(*channel);
    ASSERT_NE(uri, nullptr);
    EXPECT_EQ(uri->get("endpoint"), "replay:5000");
    EXPECT_EQ(uri->get("init-term-id"), "100");
    EXPECT_EQ(uri->get("term-id"), "102");
    EXPECT_EQ(uri->get("term-offset"), "256");
    EXPECT_EQ(uri->get("term-length"), "65536");
    EXPECT_EQ(uri->get("mtu"), "1408");
    EXPECT_EQ(uri->get("session-id"), "77");
    EXPECT_FALSE(make_replay_channel("bogus", d, 0).has_value());
}

} // namespace
