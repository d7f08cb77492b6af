#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "control/control_codec.hpp"
#include "transport/transport_view.hpp"

namespace control {

// Client side of the control protocol: encodes requests onto the archive's control
// publication. Each call makes one offer; false means the caller should retry.
class ArchiveProxy {
public:
    explicit ArchiveProxy(std::shared_ptr<transport::PublicationView> publication)
        : publication_(std::move(publication)) {}

    bool connect(const std::string& response_channel, std::int32_t response_stream_id);
    bool start_recording(const std::string& channel, std::int32_t stream_id, std::int64_t correlation_id);
    bool stop_recording(const std::string& channel, std::int32_t stream_id, std::int64_t correlation_id);
    bool replay(std::int64_t recording_id,
                std::int64_t position,
                std::int64_t length,
                const std::string& replay_channel,
                std::int32_t replay_stream_id,
                std::int64_t correlation_id);
    bool stop_replay(std::int64_t replay_id, std::int64_t correlation_id);
    bool list_recordings(std::int64_t from_recording_id, std::int32_t record_count, std::int64_t correlation_id);

    std::int64_t last_result() const noexcept { return last_result_; }

private:
    bool offer(const ControlRequest& request);

    std::shared_ptr<transport::PublicationView> publication_;
    std::int64_t last_result_{0};
};

} // namespace control
