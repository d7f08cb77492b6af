#include "control/control_codec.hpp"

#include <cstring>

#include "util/byte_order.hpp"

namespace control {

namespace {

class MessageWriter {
public:
    MessageWriter(TemplateId id, std::size_t capacity_hint) {
        out_.reserve(message_header_length + capacity_hint);
        u16(static_cast<std::uint16_t>(id));
        u16(schema_version);
    }

    void u16(std::uint16_t v) {
        const auto at = grow(2);
        util::store_le16(v, out_.data() + at);
    }
    void i32(std::int32_t v) {
        const auto at = grow(4);
        util::store_i32(v, out_.data() + at);
    }
    void i64(std::int64_t v) {
        const auto at = grow(8);
        util::store_i64(v, out_.data() + at);
    }
    void str(const std::string& s) {
        const auto at = grow(4 + s.size());
        util::store_le32(static_cast<std::uint32_t>(s.size()), out_.data() + at);
        if (!s.empty()) {
            std::memcpy(out_.data() + at + 4, s.data(), s.size());
        }
    }

    std::vector<std::byte> take() { return std::move(out_); }

private:
    std::size_t grow(std::size_t n) {
        const auto at = out_.size();
        out_.resize(at + n);
        return at;
    }

    std::vector<std::byte> out_;
};

// Reads stop at the first shortfall; `status()` then reports it.
class MessageReader {
public:
    explicit MessageReader(std::span<const std::byte> body) : body_(body) {}

    std::int32_t i32() {
        if (!need(4)) {
            return 0;
        }
        const auto v = util::load_i32(body_.data() + pos_);
        pos_ += 4;
        return v;
    }
    std::int64_t i64() {
        if (!need(8)) {
            return 0;
        }
        const auto v = util::load_i64(body_.data() + pos_);
        pos_ += 8;
        return v;
    }
    std::string str() {
        if (!need(4)) {
            return {};
        }
        const std::uint32_t len = util::load_le32(body_.data() + pos_);
        pos_ += 4;
        if (body_.size() - pos_ < len) {
            status_ = DecodeStatus::Malformed;
            return {};
        }
        std::string s(reinterpret_cast<const char*>(body_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    DecodeStatus status() const noexcept {
        if (status_ == DecodeStatus::Ok && pos_ != body_.size()) {
            return DecodeStatus::Malformed;
        }
        return status_;
    }

private:
    bool need(std::size_t n) {
        if (status_ != DecodeStatus::Ok) {
            return false;
        }
        if (body_.size() - pos_ < n) {
            status_ = DecodeStatus::Truncated;
            return false;
        }
        return true;
    }

    std::span<const std::byte> body_;
    std::size_t pos_{0};
    DecodeStatus status_{DecodeStatus::Ok};
};

DecodeStatus read_header(std::span<const std::byte> bytes, TemplateId& id) {
    if (bytes.size() < message_header_length) {
        return DecodeStatus::Truncated;
    }
    id = static_cast<TemplateId>(util::load_le16(bytes.data()));
    if (util::load_le16(bytes.data() + 2) != schema_version) {
        return DecodeStatus::UnsupportedVersion;
    }
    return DecodeStatus::Ok;
}

void write_descriptor(MessageWriter& w, const archive::RecordingDescriptor& d) {
    w.i64(d.recording_id);
    w.i64(d.join_timestamp);
    w.i64(d.end_timestamp);
    w.i64(d.join_position);
    w.i64(d.end_position);
    w.i32(d.initial_term_id);
    w.i32(d.segment_file_length);
    w.i32(d.term_buffer_length);
    w.i32(d.mtu_length);
    w.i32(d.session_id);
    w.i32(d.stream_id);
    w.str(d.stripped_channel);
    w.str(d.original_channel);
    w.str(d.source_identity);
}

archive::RecordingDescriptor read_descriptor(MessageReader& r) {
    archive::RecordingDescriptor d;
    d.recording_id = r.i64();
    d.join_timestamp = r.i64();
    d.end_timestamp = r.i64();
    d.join_position = r.i64();
    d.end_position = r.i64();
    d.initial_term_id = r.i32();
    d.segment_file_length = r.i32();
    d.term_buffer_length = r.i32();
    d.mtu_length = r.i32();
    d.session_id = r.i32();
    d.stream_id = r.i32();
    d.stripped_channel = r.str();
    d.original_channel = r.str();
    d.source_identity = r.str();
    d.state = d.end_position == archive::null_position ? archive::RecordingState::Active
                                                       : archive::RecordingState::Closed;
    return d;
}

} // namespace

const char* response_code_name(ResponseCode code) noexcept {
    switch (code) {
    case ResponseCode::Ok: return "OK";
    case ResponseCode::Error: return "ERROR";
    case ResponseCode::RecordingUnknown: return "RECORDING_UNKNOWN";
    case ResponseCode::DuplicateRecording: return "DUPLICATE_RECORDING";
    }
    return "UNKNOWN";
}

const char* decode_status_name(DecodeStatus s) noexcept {
    switch (s) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::Truncated: return "truncated";
    case DecodeStatus::UnknownTemplate: return "unknown_template";
    case DecodeStatus::UnsupportedVersion: return "unsupported_version";
    case DecodeStatus::Malformed: return "malformed";
    }
    return "unknown";
}

std::vector<std::byte> encode_request(const ControlRequest& request) {
    return std::visit(
        Overloaded{
            [](const ConnectRequest& m) {
                MessageWriter w(TemplateId::Connect, 8 + m.response_channel.size());
                w.i32(m.response_stream_id);
                w.str(m.response_channel);
                return w.take();
            },
            [](const StartRecordingRequest& m) {
                MessageWriter w(TemplateId::StartRecording, 16 + m.channel.size());
                w.i64(m.correlation_id);
                w.i32(m.stream_id);
                w.str(m.channel);
                return w.take();
            },
            [](const StopRecordingRequest& m) {
                MessageWriter w(TemplateId::StopRecording, 16 + m.channel.size());
                w.i64(m.correlation_id);
                w.i32(m.stream_id);
                w.str(m.channel);
                return w.take();
            },
            [](const ReplayRequest& m) {
                MessageWriter w(TemplateId::Replay, 40 + m.replay_channel.size());
                w.i64(m.correlation_id);
                w.i64(m.recording_id);
                w.i64(m.position);
                w.i64(m.length);
                w.i32(m.replay_stream_id);
                w.str(m.replay_channel);
                return w.take();
            },
            [](const StopReplayRequest& m) {
                MessageWriter w(TemplateId::StopReplay, 16);
                w.i64(m.correlation_id);
                w.i64(m.replay_id);
                return w.take();
            },
            [](const ListRecordingsRequest& m) {
                MessageWriter w(TemplateId::ListRecordings, 20);
                w.i64(m.correlation_id);
                w.i64(m.from_recording_id);
                w.i32(m.record_count);
                return w.take();
            },
        },
        request);
}

std::vector<std::byte> encode_response(const ControlResponse& response) {
    return std::visit(
        Overloaded{
            [](const ControlResult& m) {
                MessageWriter w(TemplateId::ControlResponse, 16 + m.error_message.size());
                w.i64(m.correlation_id);
                w.i32(static_cast<std::int32_t>(m.code));
                w.str(m.error_message);
                return w.take();
            },
            [](const ReplayStarted& m) {
                MessageWriter w(TemplateId::ReplayStarted, 16);
                w.i64(m.correlation_id);
                w.i64(m.replay_id);
                return w.take();
            },
            [](const ReplayAborted& m) {
                MessageWriter w(TemplateId::ReplayAborted, 16);
                w.i64(m.correlation_id);
                w.i64(m.end_position);
                return w.take();
            },
            [](const RecordingDescriptorMessage& m) {
                const auto& d = m.descriptor;
                MessageWriter w(TemplateId::RecordingDescriptor,
                                112 + d.stripped_channel.size() + d.original_channel.size() +
                                    d.source_identity.size());
                w.i64(m.correlation_id);
                write_descriptor(w, d);
                return w.take();
            },
            [](const RecordingNotFound& m) {
                MessageWriter w(TemplateId::RecordingNotFound, 24);
                w.i64(m.correlation_id);
                w.i64(m.recording_id);
                w.i64(m.max_recording_id);
                return w.take();
            },
        },
        response);
}

std::vector<std::byte> encode_event(const RecordingEvent& event) {
    return std::visit(
        Overloaded{
            [](const RecordingStarted& m) {
                MessageWriter w(TemplateId::RecordingStarted, 32 + m.channel.size() + m.source_identity.size());
                w.i64(m.recording_id);
                w.i64(m.join_position);
                w.i32(m.session_id);
                w.i32(m.stream_id);
                w.str(m.channel);
                w.str(m.source_identity);
                return w.take();
            },
            [](const RecordingProgress& m) {
                MessageWriter w(TemplateId::RecordingProgress, 24);
                w.i64(m.recording_id);
                w.i64(m.join_position);
                w.i64(m.position);
                return w.take();
            },
            [](const RecordingStopped& m) {
                MessageWriter w(TemplateId::RecordingStopped, 24);
                w.i64(m.recording_id);
                w.i64(m.join_position);
                w.i64(m.end_position);
                return w.take();
            },
            [](const RecordingError& m) {
                MessageWriter w(TemplateId::RecordingError, 20 + m.error_message.size());
                w.i64(m.recording_id);
                w.i64(m.end_position);
                w.str(m.error_message);
                return w.take();
            },
        },
        event);
}

DecodeStatus decode_request(std::span<const std::byte> bytes, ControlRequest& out) {
    TemplateId id{};
    if (const auto s = read_header(bytes, id); s != DecodeStatus::Ok) {
        return s;
    }
    MessageReader r(bytes.subspan(message_header_length));
    switch (id) {
    case TemplateId::Connect: {
        ConnectRequest m;
        m.response_stream_id = r.i32();
        m.response_channel = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::StartRecording: {
        StartRecordingRequest m;
        m.correlation_id = r.i64();
        m.stream_id = r.i32();
        m.channel = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::StopRecording: {
        StopRecordingRequest m;
        m.correlation_id = r.i64();
        m.stream_id = r.i32();
        m.channel = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::Replay: {
        ReplayRequest m;
        m.correlation_id = r.i64();
        m.recording_id = r.i64();
        m.position = r.i64();
        m.length = r.i64();
        m.replay_stream_id = r.i32();
        m.replay_channel = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::StopReplay: {
        StopReplayRequest m;
        m.correlation_id = r.i64();
        m.replay_id = r.i64();
        out = m;
        break;
    }
    case TemplateId::ListRecordings: {
        ListRecordingsRequest m;
        m.correlation_id = r.i64();
        m.from_recording_id = r.i64();
        m.record_count = r.i32();
        out = m;
        break;
    }
    default:
        return DecodeStatus::UnknownTemplate;
    }
    return r.status();
}

DecodeStatus decode_response(std::span<const std::byte> bytes, ControlResponse& out) {
    TemplateId id{};
    if (const auto s = read_header(bytes, id); s != DecodeStatus::Ok) {
        return s;
    }
    MessageReader r(bytes.subspan(message_header_length));
    switch (id) {
    case TemplateId::ControlResponse: {
        ControlResult m;
        m.correlation_id = r.i64();
        m.code = static_cast<ResponseCode>(r.i32());
        m.error_message = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::ReplayStarted: {
        ReplayStarted m;
        m.correlation_id = r.i64();
        m.replay_id = r.i64();
        out = m;
        break;
    }
    case TemplateId::ReplayAborted: {
        ReplayAborted m;
        m.correlation_id = r.i64();
        m.end_position = r.i64();
        out = m;
        break;
    }
    case TemplateId::RecordingDescriptor: {
        RecordingDescriptorMessage m;
        m.correlation_id = r.i64();
        m.descriptor = read_descriptor(r);
        out = std::move(m);
        break;
    }
    case TemplateId::RecordingNotFound: {
        RecordingNotFound m;
        m.correlation_id = r.i64();
        m.recording_id = r.i64();
        m.max_recording_id = r.i64();
        out = m;
        break;
    }
    default:
        return DecodeStatus::UnknownTemplate;
    }
    return r.status();
}

DecodeStatus decode_event(std::span<const std::byte> bytes, RecordingEvent& out) {
    TemplateId id{};
    if (const auto s = read_header(bytes, id); s != DecodeStatus::Ok) {
        return s;
    }
    MessageReader r(bytes.subspan(message_header_length));
    switch (id) {
    case TemplateId::RecordingStarted: {
        RecordingStarted m;
        m.recording_id = r.i64();
        m.join_position = r.i64();
        m.session_id = r.i32();
        m.stream_id = r.i32();
        m.channel = r.str();
        m.source_identity = r.str();
        out = std::move(m);
        break;
    }
    case TemplateId::RecordingProgress: {
        RecordingProgress m;
        m.recording_id = r.i64();
        m.join_position = r.i64();
        m.position = r.i64();
        out = m;
        break;
    }
    case TemplateId::RecordingStopped: {
        RecordingStopped m;
        m.recording_id = r.i64();
        m.join_position = r.i64();
        m.end_position = r.i64();
        out = m;
        break;
    }
    case TemplateId::RecordingError: {
        RecordingError m;
        m.recording_id = r.i64();
        m.end_position = r.i64();
        m.error_message = r.str();
        out = std::move(m);
        break;
    }
    default:
        return DecodeStatus::UnknownTemplate;
    }
    return r.status();
}

std::int64_t correlation_id_of(const ControlResponse& response) noexcept {
    return std::visit([](const auto& m) { return m.correlation_id; }, response);
}

} // namespace control
