#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "archive/recording_descriptor.hpp"

namespace control {

// Every message starts with [template_id u16][schema_version u16], little-endian; strings
// are [length u32][bytes].
inline constexpr std::uint16_t schema_version = 1;
inline constexpr std::size_t message_header_length = 4;

enum class TemplateId : std::uint16_t {
    Connect = 1,
    StartRecording = 2,
    StopRecording = 3,
    Replay = 4,
    StopReplay = 5,
    ListRecordings = 6,

    ControlResponse = 20,
    ReplayStarted = 21,
    ReplayAborted = 22,
    RecordingDescriptor = 23,
    RecordingNotFound = 24,

    RecordingStarted = 30,
    RecordingProgress = 31,
    RecordingStopped = 32,
    RecordingError = 33,
};

enum class ResponseCode : std::int32_t {
    Ok = 0,
    Error = 1,
    RecordingUnknown = 2,
    DuplicateRecording = 3,
};

const char* response_code_name(ResponseCode code) noexcept;

enum class DecodeStatus {
    Ok,
    Truncated,
    UnknownTemplate,
    UnsupportedVersion,
    Malformed,  // trailing bytes or a string length past the end
};

const char* decode_status_name(DecodeStatus s) noexcept;

// Requests

struct ConnectRequest {
    std::int32_t response_stream_id{0};
    std::string response_channel;
};

struct StartRecordingRequest {
    std::int64_t correlation_id{0};
    std::int32_t stream_id{0};
    std::string channel;
};

struct StopRecordingRequest {
    std::int64_t correlation_id{0};
    std::int32_t stream_id{0};
    std::string channel;
};

struct ReplayRequest {
    std::int64_t correlation_id{0};
    std::int64_t recording_id{0};
    std::int64_t position{0};
    std::int64_t length{0};
    std::int32_t replay_stream_id{0};
    std::string replay_channel;
};

struct StopReplayRequest {
    std::int64_t correlation_id{0};
    std::int64_t replay_id{0};
};

struct ListRecordingsRequest {
    std::int64_t correlation_id{0};
    std::int64_t from_recording_id{0};
    std::int32_t record_count{0};
};

using ControlRequest = std::variant<ConnectRequest,
                                    StartRecordingRequest,
                                    StopRecordingRequest,
                                    ReplayRequest,
                                    StopReplayRequest,
                                    ListRecordingsRequest>;

// Responses

struct ControlResult {
    std::int64_t correlation_id{0};
    ResponseCode code{ResponseCode::Ok};
    std::string error_message;
};

struct ReplayStarted {
    std::int64_t correlation_id{0};
    std::int64_t replay_id{0};
};

struct ReplayAborted {
    std::int64_t correlation_id{0};
    std::int64_t end_position{0};
};

struct RecordingDescriptorMessage {
    std::int64_t correlation_id{0};
    archive::RecordingDescriptor descriptor;
};

struct RecordingNotFound {
    std::int64_t correlation_id{0};
    std::int64_t recording_id{0};
    std::int64_t max_recording_id{0};
};

using ControlResponse =
    std::variant<ControlResult, ReplayStarted, ReplayAborted, RecordingDescriptorMessage, RecordingNotFound>;

// Recording events, broadcast without acknowledgement.

struct RecordingStarted {
    std::int64_t recording_id{0};
    std::int64_t join_position{0};
    std::int32_t session_id{0};
    std::int32_t stream_id{0};
    std::string channel;
    std::string source_identity;
};

struct RecordingProgress {
    std::int64_t recording_id{0};
    std::int64_t join_position{0};
    std::int64_t position{0};
};

struct RecordingStopped {
    std::int64_t recording_id{0};
    std::int64_t join_position{0};
    std::int64_t end_position{0};
};

struct RecordingError {
    std::int64_t recording_id{0};
    std::int64_t end_position{0};
    std::string error_message;
};

using RecordingEvent = std::variant<RecordingStarted, RecordingProgress, RecordingStopped, RecordingError>;

template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

std::vector<std::byte> encode_request(const ControlRequest& request);
std::vector<std::byte> encode_response(const ControlResponse& response);
std::vector<std::byte> encode_event(const RecordingEvent& event);

DecodeStatus decode_request(std::span<const std::byte> bytes, ControlRequest& out);
DecodeStatus decode_response(std::span<const std::byte> bytes, ControlResponse& out);
DecodeStatus decode_event(std::span<const std::byte> bytes, RecordingEvent& out);

std::int64_t correlation_id_of(const ControlResponse& response) noexcept;

} // namespace control
