#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "control/control_codec.hpp"
#include "transport/transport_view.hpp"
#include "util/clock.hpp"

namespace control {

enum class ControlSessionState {
    Connecting,  // response publication not yet registered
    Active,
    Closed,
};

// One connected client: its response publication and the responses that met
// back-pressure, retried in order on later turns. A session whose publication stays
// unresolved or not connected for longer than the liveness timeout is closed.
class ControlSession {
public:
    ControlSession(std::int64_t control_session_id,
                   std::string response_channel,
                   std::int32_t response_stream_id,
                   transport::AeronClientView& client,
                   std::size_t queue_limit,
                   const util::SteadyClock& clock,
                   std::chrono::milliseconds liveness_timeout);

    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;

    // Resolves the response publication and flushes queued responses.
    int do_work();

    // Sends now when nothing is queued ahead, otherwise queues. Returns false if the
    // response was dropped because the queue is full or the session is closed.
    bool send(const ControlResponse& response);

    bool has_capacity(std::size_t count = 1) const noexcept {
        return state_ != ControlSessionState::Closed && queue_.size() + count <= queue_limit_;
    }

    void close() noexcept { state_ = ControlSessionState::Closed; }

    std::int64_t id() const noexcept { return id_; }
    ControlSessionState state() const noexcept { return state_; }
    bool is_closed() const noexcept { return state_ == ControlSessionState::Closed; }
    std::size_t queued() const noexcept { return queue_.size(); }
    std::uint64_t dropped() const noexcept { return dropped_; }

private:
    // true when the message left (or the session closed); false to retry later.
    bool try_offer(const std::vector<std::byte>& message);
    bool check_liveness(bool connected);

    std::int64_t id_;
    std::string response_channel_;
    std::int32_t response_stream_id_;
    transport::AeronClientView& client_;
    std::size_t queue_limit_;
    const util::SteadyClock& clock_;
    std::chrono::milliseconds liveness_timeout_;
    util::SteadyClock::time_point disconnected_since_;

    std::int64_t registration_id_{-1};
    std::shared_ptr<transport::PublicationView> publication_;
    std::deque<std::vector<std::byte>> queue_;
    ControlSessionState state_{ControlSessionState::Connecting};
    std::uint64_t dropped_{0};
};

} // namespace control
