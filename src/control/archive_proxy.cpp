#include "control/archive_proxy.hpp"

namespace control {

bool ArchiveProxy::connect(const std::string& response_channel, std::int32_t response_stream_id) {
    return offer(ConnectRequest{response_stream_id, response_channel});
}

bool ArchiveProxy::start_recording(const std::string& channel, std::int32_t stream_id, std::int64_t correlation_id) {
    return offer(StartRecordingRequest{correlation_id, stream_id, channel});
}

bool ArchiveProxy::stop_recording(const std::string& channel, std::int32_t stream_id, std::int64_t correlation_id) {
    return offer(StopRecordingRequest{correlation_id, stream_id, channel});
}

bool ArchiveProxy::replay(std::int64_t recording_id,
                          std::int64_t position,
                          std::int64_t length,
                          const std::string& replay_channel,
                          std::int32_t replay_stream_id,
                          std::int64_t correlation_id) {
    return offer(ReplayRequest{correlation_id, recording_id, position, length, replay_stream_id, replay_channel});
}

bool ArchiveProxy::stop_replay(std::int64_t replay_id, std::int64_t correlation_id) {
    return offer(StopReplayRequest{correlation_id, replay_id});
}

bool ArchiveProxy::list_recordings(std::int64_t from_recording_id,
                                   std::int32_t record_count,
                                   std::int64_t correlation_id) {
    return offer(ListRecordingsRequest{correlation_id, from_recording_id, record_count});
}

bool ArchiveProxy::offer(const ControlRequest& request) {
    const std::vector<std::byte> message = encode_request(request);
    last_result_ = publication_->offer(message);
    return last_result_ >= 0;
}

} // namespace control
