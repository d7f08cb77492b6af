#include <gtest/gtest.h>

#include "control/control_codec.hpp"
#include "util/byte_order.hpp"

namespace {

using namespace control;

TEST(ControlCodec, ReplayRequestFieldsSurviveTheWire) {
    const ReplayRequest sent{42, 7, 4096, -1, 2002, "aeron:udp?endpoint=localhost:9000"};
    const auto bytes = encode_request(sent);
    EXPECT_EQ(util::load_le16(bytes.data()), static_cast<std::uint16_t>(TemplateId::Replay));
    EXPECT_EQ(util::load_le16(bytes.data() + 2), schema_version);

    ControlRequest decoded;
    ASSERT_EQ(decode_request(bytes, decoded), DecodeStatus::Ok);
    const auto* r = std::get_if<ReplayRequest>(&decoded);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->correlation_id, 42);
    EXPECT_EQ(r->recording_id, 7);
    EXPECT_EQ(r->position, 4096);
    EXPECT_EQ(r->length, -1);
    EXPECT_EQ(r->replay_stream_id, 2002);
    EXPECT_EQ(r->replay_channel, sent.replay_channel);
}

TEST(ControlCodec, CorrelationIdLeadsEveryRequestBody) {
    const std::vector<ControlRequest> requests = {
        StartRecordingRequest{11, 1, "aeron:ipc"},
        StopRecordingRequest{12, 1, "aeron:ipc"},
        ReplayRequest{13, 0, 0, 64, 5, "aeron:ipc"},
        StopReplayRequest{14, 3},
        ListRecordingsRequest{15, 0, 10},
    };
    std::int64_t expected = 11;
    for (const auto& request : requests) {
        const auto bytes = encode_request(request);
        EXPECT_EQ(util::load_i64(bytes.data() + message_header_length), expected++);
    }
}

TEST(ControlCodec, TruncatedAndTrailingBytesAreRejected) {
    auto bytes = encode_request(StartRecordingRequest{1, 10, "aeron:udp?endpoint=x:1"});
    ControlRequest decoded;

    std::vector<std::byte> cut(bytes.begin(), bytes.begin() + 10);
    EXPECT_EQ(decode_request(cut, decoded), DecodeStatus::Truncated);

    std::vector<std::byte> short_string(bytes.begin(), bytes.end() - 3);
    EXPECT_EQ(decode_request(short_string, decoded), DecodeStatus::Malformed);

    bytes.push_back(std::byte{0});
    EXPECT_EQ(decode_request(bytes, decoded), DecodeStatus::Malformed);

    EXPECT_EQ(decode_request(std::span<const std::byte>(bytes.data(), 2), decoded), DecodeStatus::Truncated);
}

TEST(ControlCodec, UnknownTemplateAndVersion) {
    auto bytes = encode_request(StopReplayRequest{1, 2});
    ControlRequest decoded;
    util::store_le16(999, bytes.data());
    EXPECT_EQ(decode_request(bytes, decoded), DecodeStatus::UnknownTemplate);

    bytes = encode_request(StopReplayRequest{1, 2});
    util::store_le16(schema_version + 1, bytes.data() + 2);
    EXPECT_EQ(decode_request(bytes, decoded), DecodeStatus::UnsupportedVersion);

    // A response template is not a request.
    const auto response = encode_response(ReplayStarted{1, 2});
    EXPECT_EQ(decode_request(response, decoded), DecodeStatus::UnknownTemplate);
}

TEST(ControlCodec, DescriptorStateFollowsEndPosition) {
    archive::RecordingDescriptor d;
    d.recording_id = 3;
    d.join_position = 1024;
    d.end_position = archive::null_position;
    d.stripped_channel = "aeron:ipc";
    d.original_channel = "aeron:ipc?term-length=65536";
    d.source_identity = "aeron:ipc";

    ControlResponse decoded;
    ASSERT_EQ(decode_response(encode_response(RecordingDescriptorMessage{9, d}), decoded), DecodeStatus::Ok);
    auto* m = std::get_if<RecordingDescriptorMessage>(&decoded);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->correlation_id, 9);
    EXPECT_EQ(m->descriptor.state, archive::RecordingState::Active);
    EXPECT_EQ(m->descriptor.original_channel, d.original_channel);

    d.end_position = 8192;
    ASSERT_EQ(decode_response(encode_response(RecordingDescriptorMessage{9, d}), decoded), DecodeStatus::Ok);
    EXPECT_EQ(std::get<RecordingDescriptorMessage>(decoded).descriptor.state, archive::RecordingState::Closed);
}

TEST(ControlCodec, ResponsesCarryTheirCorrelationId) {
    EXPECT_EQ(correlation_id_of(ControlResult{5, ResponseCode::Error, "x"}), 5);
    EXPECT_EQ(correlation_id_of(ReplayStarted{6, 1}), 6);
    EXPECT_EQ(correlation_id_of(ReplayAborted{7, 0}), 7);
    EXPECT_EQ(correlation_id_of(RecordingNotFound{8, 5, 2}), 8);

    ControlResponse decoded;
    ASSERT_EQ(decode_response(encode_response(RecordingNotFound{8, 5, 2}), decoded), DecodeStatus::Ok);
    const auto& nf = std::get<RecordingNotFound>(decoded);
    EXPECT_EQ(nf.recording_id, 5);
    EXPECT_EQ(nf.max_recording_id, 2);
}

TEST(ControlCodec, EventsDecode) {
    RecordingEvent decoded;
    ASSERT_EQ(decode_event(encode_event(RecordingStarted{1, 0, 7, 1001, "aeron:ipc", "src"}), decoded),
              DecodeStatus::Ok);
    EXPECT_EQ(std::get<RecordingStarted>(decoded).source_identity, "src");

    ASSERT_EQ(decode_event(encode_event(RecordingError{1, 640, "disk full"}), decoded), DecodeStatus::Ok);
    EXPECT_EQ(std::get<RecordingError>(decoded).end_position, 640);
    EXPECT_EQ(std::get<RecordingError>(decoded).error_message, "disk full");
}

} // namespace
