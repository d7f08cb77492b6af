#include <gtest/gtest.h>

#include "control/archive_proxy.hpp"
#include "control/control_session.hpp"
#include "control/recording_events_proxy.hpp"
#include "harness/fake_transport.hpp"

namespace {

using namespace control;

const std::string kResponseChannel = "aeron:udp?endpoint=localhost:9010";
constexpr std::chrono::milliseconds kLiveness{1000};

std::int64_t correlation_of(const std::vector<std::byte>& message) {
    ControlResponse response;
    EXPECT_EQ(decode_response(message, response), DecodeStatus::Ok);
    return correlation_id_of(response);
}

TEST(ControlSessionTest, QueuesUntilPublicationResolves) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    EXPECT_EQ(session.state(), ControlSessionState::Connecting);

    EXPECT_TRUE(session.send(ControlResult{100, ResponseCode::Ok, {}}));
    EXPECT_EQ(session.queued(), 1u);

    EXPECT_GT(session.do_work(), 0);
    EXPECT_EQ(session.state(), ControlSessionState::Active);
    auto pub = client.publication(kResponseChannel, 20);
    ASSERT_NE(pub, nullptr);
    ASSERT_EQ(pub->messages.size(), 1u);
    EXPECT_EQ(correlation_of(pub->messages[0]), 100);
}

TEST(ControlSessionTest, BackPressureKeepsResponsesInOrder) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    session.do_work();
    auto pub = client.publication(kResponseChannel, 20);
    ASSERT_NE(pub, nullptr);

    pub->scripted = {transport::back_pressured, transport::admin_action};
    EXPECT_TRUE(session.send(ControlResult{1, ResponseCode::Ok, {}}));
    EXPECT_TRUE(session.send(ControlResult{2, ResponseCode::Ok, {}}));
    EXPECT_TRUE(pub->messages.empty());
    EXPECT_EQ(session.queued(), 2u);

    session.do_work();  // second scripted failure
    EXPECT_TRUE(pub->messages.empty());
    session.do_work();
    ASSERT_EQ(pub->messages.size(), 2u);
    EXPECT_EQ(correlation_of(pub->messages[0]), 1);
    EXPECT_EQ(correlation_of(pub->messages[1]), 2);

    // Nothing queued ahead any more, so a new response goes straight out.
    EXPECT_TRUE(session.send(ControlResult{3, ResponseCode::Ok, {}}));
    ASSERT_EQ(pub->messages.size(), 3u);
    EXPECT_EQ(session.queued(), 0u);
}

TEST(ControlSessionTest, QueueLimitDropsNewResponses) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    ControlSession session(1, kResponseChannel, 20, client, 2, clock, kLiveness);
    EXPECT_TRUE(session.has_capacity(2));
    EXPECT_TRUE(session.send(ControlResult{1, ResponseCode::Ok, {}}));
    EXPECT_TRUE(session.send(ControlResult{2, ResponseCode::Ok, {}}));
    EXPECT_FALSE(session.has_capacity());
    EXPECT_FALSE(session.send(ControlResult{3, ResponseCode::Ok, {}}));
    EXPECT_EQ(session.dropped(), 1u);
}

TEST(ControlSessionTest, ClosedPublicationClosesSession) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    session.do_work();
    auto pub = client.publication(kResponseChannel, 20);
    ASSERT_NE(pub, nullptr);
    pub->close();
    EXPECT_FALSE(session.send(ControlResult{1, ResponseCode::Ok, {}}));
    EXPECT_TRUE(session.is_closed());
    EXPECT_FALSE(session.send(ControlResult{2, ResponseCode::Ok, {}}));
}

TEST(ControlSessionTest, FailedRegistrationClosesSession) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    client.reject_adds = true;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    EXPECT_TRUE(session.is_closed());
    EXPECT_EQ(session.do_work(), 0);
}

TEST(ControlSessionTest, DisconnectedClientIsClosedAfterLivenessTimeout) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    session.do_work();
    auto pub = client.publication(kResponseChannel, 20);
    ASSERT_NE(pub, nullptr);

    pub->connected = false;
    pub->scripted.assign(5, transport::not_connected);
    EXPECT_TRUE(session.send(ControlResult{1, ResponseCode::Ok, {}}));
    EXPECT_EQ(session.queued(), 1u);

    clock.advance(std::chrono::milliseconds{600});
    session.do_work();
    EXPECT_EQ(session.state(), ControlSessionState::Active);

    // Reconnecting restarts the timer.
    pub->connected = true;
    session.do_work();
    pub->connected = false;
    clock.advance(std::chrono::milliseconds{600});
    session.do_work();
    EXPECT_EQ(session.state(), ControlSessionState::Active);

    clock.advance(std::chrono::milliseconds{400});
    EXPECT_GT(session.do_work(), 0);
    EXPECT_TRUE(session.is_closed());
    EXPECT_EQ(session.queued(), 0u);
    EXPECT_EQ(session.dropped(), 1u);
    EXPECT_TRUE(pub->messages.empty());
}

TEST(ControlSessionTest, UnresolvedPublicationTimesOut) {
    test::FakeClient client;
    test::ManualSteadyClock clock;
    client.hold_registrations = true;
    ControlSession session(1, kResponseChannel, 20, client, 16, clock, kLiveness);
    EXPECT_EQ(session.do_work(), 0);
    clock.advance(std::chrono::milliseconds{999});
    EXPECT_EQ(session.do_work(), 0);
    EXPECT_EQ(session.state(), ControlSessionState::Connecting);

    clock.advance(std::chrono::milliseconds{1});
    EXPECT_EQ(session.do_work(), 1);
    EXPECT_TRUE(session.is_closed());
}

std::vector<RecordingEvent> decode_all(const test::FakePublication& pub) {
    std::vector<RecordingEvent> out;
    for (const auto& m : pub.messages) {
        RecordingEvent e;
        EXPECT_EQ(decode_event(m, e), DecodeStatus::Ok);
        out.push_back(std::move(e));
    }
    return out;
}

TEST(RecordingEventsProxyTest, ProgressIsCoalescedAndMonotonic) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    RecordingEventsProxy events;
    events.set_publication(pub);

    events.started(RecordingStarted{0, 1024, 7, 1001, "aeron:ipc", "src"});
    EXPECT_TRUE(events.progress(0, 1024, 2048));
    EXPECT_FALSE(events.progress(0, 1024, 2048));
    EXPECT_FALSE(events.progress(0, 1024, 1536));

    pub->scripted = {transport::back_pressured};
    EXPECT_FALSE(events.progress(0, 1024, 4096));
    EXPECT_EQ(events.last_progress(0), 2048);
    EXPECT_TRUE(events.progress(0, 1024, 8192));

    events.stopped(RecordingStopped{0, 1024, 9216});
    const auto all = decode_all(*pub);
    ASSERT_EQ(all.size(), 5u);
    EXPECT_TRUE(std::holds_alternative<RecordingStarted>(all[0]));
    EXPECT_EQ(std::get<RecordingProgress>(all[1]).position, 2048);
    EXPECT_EQ(std::get<RecordingProgress>(all[2]).position, 8192);
    EXPECT_EQ(std::get<RecordingProgress>(all[3]).position, 9216);
    EXPECT_EQ(std::get<RecordingStopped>(all[4]).end_position, 9216);
    EXPECT_EQ(events.last_progress(0), archive::null_position);
}

TEST(RecordingEventsProxyTest, LifecycleEventsRetryInOrder) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    RecordingEventsProxy events;
    events.set_publication(pub);
    pub->scripted = {transport::back_pressured};

    events.started(RecordingStarted{0, 0, 7, 1001, "aeron:ipc", "src"});
    events.error(RecordingError{0, 64, "disk full"});
    EXPECT_EQ(events.queued(), 2u);
    EXPECT_FALSE(events.progress(0, 0, 32));

    EXPECT_EQ(events.do_work(), 2);
    const auto all = decode_all(*pub);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<RecordingStarted>(all[0]));
    EXPECT_TRUE(std::holds_alternative<RecordingError>(all[1]));
}

TEST(RecordingEventsProxyTest, NobodyListeningIsNotAFailure) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    RecordingEventsProxy events;
    events.set_publication(pub);
    pub->scripted = {transport::not_connected};
    events.started(RecordingStarted{0, 0, 7, 1001, "aeron:ipc", "src"});
    EXPECT_EQ(events.queued(), 0u);
}

TEST(RecordingEventsProxyTest, FinalProgressQueuesAheadOfStop) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    RecordingEventsProxy events;
    events.set_publication(pub);

    pub->scripted = {transport::back_pressured};
    events.started(RecordingStarted{0, 0, 7, 1001, "aeron:ipc", "src"});
    ASSERT_EQ(events.queued(), 1u);
    events.stopped(RecordingStopped{0, 0, 4096});
    EXPECT_EQ(events.queued(), 3u);

    EXPECT_EQ(events.do_work(), 3);
    const auto all = decode_all(*pub);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<RecordingStarted>(all[0]));
    EXPECT_EQ(std::get<RecordingProgress>(all[1]).position, 4096);
    EXPECT_EQ(std::get<RecordingStopped>(all[2]).end_position, 4096);
}

TEST(RecordingEventsProxyTest, BackPressuredFinalProgressIsRetried) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    RecordingEventsProxy events;
    events.set_publication(pub);
    events.started(RecordingStarted{0, 0, 7, 1001, "aeron:ipc", "src"});

    pub->scripted = {transport::back_pressured};
    events.stopped(RecordingStopped{0, 0, 2048});
    EXPECT_EQ(events.queued(), 2u);
    events.do_work();
    const auto all = decode_all(*pub);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(std::get<RecordingProgress>(all[1]).position, 2048);
    EXPECT_TRUE(std::holds_alternative<RecordingStopped>(all[2]));
}

TEST(RecordingEventsProxyTest, QueueLimitDropsOldest) {
    RecordingEventsProxy events(2);
    events.error(RecordingError{0, 32, "a"});
    events.error(RecordingError{1, 64, "b"});
    events.error(RecordingError{2, 96, "c"});
    EXPECT_EQ(events.queued(), 2u);

    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 11);
    events.set_publication(pub);
    events.do_work();
    const auto all = decode_all(*pub);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(std::get<RecordingError>(all[0]).recording_id, 1);
    EXPECT_EQ(std::get<RecordingError>(all[1]).recording_id, 2);
}

TEST(ArchiveProxyTest, EncodesRequestsOntoPublication) {
    auto pub = std::make_shared<test::FakePublication>("aeron:ipc", 10);
    ArchiveProxy proxy(pub);
    EXPECT_TRUE(proxy.connect(kResponseChannel, 20));
    EXPECT_TRUE(proxy.list_recordings(0, 10, 77));
    ASSERT_EQ(pub->messages.size(), 2u);

    ControlRequest request;
    ASSERT_EQ(decode_request(pub->messages[1], request), DecodeStatus::Ok);
    const auto& list = std::get<ListRecordingsRequest>(request);
    EXPECT_EQ(list.correlation_id, 77);
    EXPECT_EQ(list.record_count, 10);

    pub->scripted = {transport::back_pressured};
    EXPECT_FALSE(proxy.stop_replay(1, 78));
    EXPECT_EQ(proxy.last_result(), transport::back_pressured);
}

} // namespace
