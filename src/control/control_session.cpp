#include "control/control_session.hpp"

#include "util/log.hpp"

namespace control {

namespace {
constexpr const char* kComponent = "control";
}

ControlSession::ControlSession(std::int64_t control_session_id,
                               std::string response_channel,
                               std::int32_t response_stream_id,
                               transport::AeronClientView& client,
                               std::size_t queue_limit,
                               const util::SteadyClock& clock,
                               std::chrono::milliseconds liveness_timeout)
    : id_(control_session_id),
      response_channel_(std::move(response_channel)),
      response_stream_id_(response_stream_id),
      client_(client),
      queue_limit_(queue_limit),
      clock_(clock),
      liveness_timeout_(liveness_timeout),
      disconnected_since_(clock.now()) {
    registration_id_ = client_.add_publication(response_channel_, response_stream_id_);
    if (registration_id_ < 0) {
        LOG_SLOW_ERROR(kComponent, "session %lld: cannot add response publication %s stream %d",
                       static_cast<long long>(id_), response_channel_.c_str(), response_stream_id_);
        state_ = ControlSessionState::Closed;
    }
}

int ControlSession::do_work() {
    if (state_ == ControlSessionState::Closed) {
        return 0;
    }
    int work = 0;
    if (state_ == ControlSessionState::Connecting) {
        auto found = client_.find_publication(registration_id_);
        if (found.failed) {
            LOG_SLOW_ERROR(kComponent, "session %lld: response publication failed: %s", static_cast<long long>(id_),
                           found.error.c_str());
            state_ = ControlSessionState::Closed;
            return 1;
        }
        if (!found.resource) {
            return check_liveness(false) ? 0 : 1;
        }
        publication_ = std::move(found.resource);
        state_ = ControlSessionState::Active;
        ++work;
    }
    if (!check_liveness(publication_->is_connected())) {
        return work + 1;
    }
    while (!queue_.empty() && state_ == ControlSessionState::Active) {
        if (!try_offer(queue_.front())) {
            break;
        }
        if (state_ == ControlSessionState::Closed) {
            queue_.clear();
            break;
        }
        queue_.pop_front();
        ++work;
    }
    return work;
}

bool ControlSession::send(const ControlResponse& response) {
    if (state_ == ControlSessionState::Closed) {
        ++dropped_;
        return false;
    }
    std::vector<std::byte> message = encode_response(response);
    if (queue_.empty() && state_ == ControlSessionState::Active && try_offer(message)) {
        return state_ == ControlSessionState::Active;
    }
    if (queue_.size() >= queue_limit_) {
        ++dropped_;
        LOG_SLOW_WARN(kComponent, "session %lld: response queue full, dropping response for correlation %lld",
                      static_cast<long long>(id_), static_cast<long long>(correlation_id_of(response)));
        return false;
    }
    queue_.push_back(std::move(message));
    return true;
}

// false once the session was closed for staying disconnected too long.
bool ControlSession::check_liveness(bool connected) {
    const auto now = clock_.now();
    if (connected) {
        disconnected_since_ = now;
        return true;
    }
    if (now - disconnected_since_ < liveness_timeout_) {
        return true;
    }
    LOG_SLOW_WARN(kComponent, "session %lld: response publication not connected for %lld ms, closing with %zu queued",
                  static_cast<long long>(id_),
                  static_cast<long long>(
                      std::chrono::duration_cast<std::chrono::milliseconds>(now - disconnected_since_).count()),
                  queue_.size());
    dropped_ += queue_.size();
    queue_.clear();
    state_ = ControlSessionState::Closed;
    return false;
}

bool ControlSession::try_offer(const std::vector<std::byte>& message) {
    const std::int64_t result = publication_->offer(message);
    if (result >= 0) {
        return true;
    }
    if (result == transport::back_pressured || result == transport::admin_action ||
        result == transport::not_connected) {
        return false;
    }
    LOG_SLOW_WARN(kComponent, "session %lld: response publication lost (%s), closing", static_cast<long long>(id_),
                  transport::offer_result_name(result));
    state_ = ControlSessionState::Closed;
    return true;
}

} // namespace control
