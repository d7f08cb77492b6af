#include "archive/recording_session.hpp"

#include "archive/position.hpp"
#include "util/log.hpp"

namespace archive {

namespace {
constexpr const char* kComponent = "recording";
constexpr auto kErrorLogInterval = std::chrono::seconds{1};
}

const char* recording_state_name(RecordingSessionState s) noexcept {
    switch (s) {
    case RecordingSessionState::Init: return "INIT";
    case RecordingSessionState::Recording: return "RECORDING";
    case RecordingSessionState::Stopping: return "STOPPING";
    case RecordingSessionState::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

RecordingSession::RecordingSession(RecordingDescriptor descriptor,
                                   std::shared_ptr<transport::ImageView> image,
                                   persist::SegmentStore& store,
                                   std::int32_t block_length,
                                   const util::SystemClock& clock)
    : descriptor_(std::move(descriptor)),
      image_(std::move(image)),
      store_(store),
      block_length_(block_length),
      clock_(clock),
      position_bits_to_shift_(position_bits_to_shift(descriptor_.term_buffer_length)),
      image_correlation_id_(image_->correlation_id()),
      frontier_(std::make_shared<RecordingFrontier>()),
      error_log_(kErrorLogInterval) {
    frontier_->position = descriptor_.join_position;
    handler_ = [this](std::span<const std::byte> block, std::int32_t term_offset, std::int32_t, std::int32_t term_id) {
        on_block(block, term_offset, term_id);
    };
}

RecordingSession::~RecordingSession() {
    if (segment_) {
        const persist::StoreResult closed = store_.close(*segment_);
        if (!closed.ok()) {
            LOG_SLOW_ERROR(kComponent, "recording %lld failed to close segment on teardown: %d",
                           static_cast<long long>(descriptor_.recording_id), closed.error_code);
        }
    }
}

std::optional<RecordingDescriptor> RecordingSession::take_activated() {
    if (!activation_pending_) {
        return std::nullopt;
    }
    activation_pending_ = false;
    RecordingDescriptor active = descriptor_;
    active.state = RecordingState::Active;
    return active;
}

int RecordingSession::do_work() {
    switch (state_) {
    case RecordingSessionState::Init:
        LOG_SLOW_INFO(kComponent, "recording %lld started: session=%d stream=%d join=%lld channel=%s",
                      static_cast<long long>(descriptor_.recording_id), descriptor_.session_id, descriptor_.stream_id,
                      static_cast<long long>(descriptor_.join_position), descriptor_.original_channel.c_str());
        state_ = RecordingSessionState::Recording;
        return 1;

    case RecordingSessionState::Recording: {
        if (stop_requested_) {
            state_ = RecordingSessionState::Stopping;
            // One final drain picks up whatever the image already holds.
            const int bytes = poll_block();
            finish();
            return bytes + 1;
        }
        if (image_->is_closed()) {
            state_ = RecordingSessionState::Stopping;
            int total = 0;
            int bytes = 0;
            while (state_ == RecordingSessionState::Stopping && (bytes = poll_block()) > 0) {
                total += bytes;
            }
            finish();
            return total + 1;
        }
        return poll_block();
    }

    case RecordingSessionState::Stopping:
        finish();
        return 1;

    case RecordingSessionState::Stopped:
        return 0;
    }
    return 0;
}

int RecordingSession::poll_block() {
    const int bytes = image_->block_poll(handler_, block_length_);
    if (error_) {
        finish();
    }
    return bytes;
}

bool RecordingSession::ensure_segment(std::int64_t position) {
    const std::int64_t index = segment_index(position, descriptor_.segment_file_length);
    if (segment_ && segment_->segment_index() == index) {
        return true;
    }
    if (segment_) {
        const persist::StoreResult closed = store_.close(*segment_);
        segment_.reset();
        if (!closed.ok()) {
            fail(ArchiveErrorKind::Storage, "segment close failed", closed.error_code);
            return false;
        }
    }
    const persist::SegmentGeometry geometry{descriptor_.segment_file_length, descriptor_.term_buffer_length};
    const persist::StoreResult opened = store_.open(descriptor_.recording_id, index, geometry, segment_);
    if (!opened.ok()) {
        fail(ArchiveErrorKind::Storage,
             std::string("segment open failed: ") + persist::store_status_name(opened.status), opened.error_code);
        return false;
    }
    return true;
}

void RecordingSession::on_block(std::span<const std::byte> block, std::int32_t term_offset, std::int32_t term_id) {
    if (error_) {
        return;
    }
    const std::int64_t position =
        compute_position(term_id, term_offset, position_bits_to_shift_, descriptor_.initial_term_id);
    if (position != frontier_->position) {
        fail(ArchiveErrorKind::Storage, "non-contiguous block at " + std::to_string(position) + ", expected " +
                                            std::to_string(frontier_->position));
        return;
    }
    if (!ensure_segment(position)) {
        return;
    }
    const std::int64_t offset = position - segment_->base_position();
    if (offset + static_cast<std::int64_t>(block.size()) > descriptor_.segment_file_length) {
        fail(ArchiveErrorKind::Storage, "block crosses segment boundary at " + std::to_string(position));
        return;
    }

    const persist::StoreResult written = store_.write(*segment_, offset, block);
    if (!written.ok()) {
        fail(ArchiveErrorKind::Storage,
             std::string("segment write failed: ") + persist::store_status_name(written.status), written.error_code);
        return;
    }
    frontier_->position = position + static_cast<std::int64_t>(block.size());
    if (descriptor_.state == RecordingState::Provisional) {
        descriptor_.state = RecordingState::Active;
        activation_pending_ = true;
    }
    if (segment_->sealed()) {
        const persist::StoreResult closed = store_.close(*segment_);
        segment_.reset();
        if (!closed.ok()) {
            fail(ArchiveErrorKind::Storage, "segment close failed", closed.error_code);
        }
    }
}

void RecordingSession::fail(ArchiveErrorKind kind, std::string message, int error_code) {
    const bool logged = error_log_.admit(clock_.now());
    if (error_) {
        // Only the first error ends the recording.
        if (logged) {
            LOG_SLOW_WARN(kComponent, "recording %lld: further error after failure: %s (errno=%d, %llu suppressed)",
                          static_cast<long long>(descriptor_.recording_id), message.c_str(), error_code,
                          static_cast<unsigned long long>(error_log_.take_suppressed()));
        }
        return;
    }
    LOG_SLOW_ERROR(kComponent, "recording %lld failed at %lld: %s (errno=%d)",
                   static_cast<long long>(descriptor_.recording_id), static_cast<long long>(frontier_->position),
                   message.c_str(), error_code);
    error_ = ArchiveError{kind, std::move(message), error_code};
}

void RecordingSession::finish() {
    if (state_ == RecordingSessionState::Stopped) {
        return;
    }
    if (segment_) {
        const persist::StoreResult closed = store_.close(*segment_);
        segment_.reset();
        if (!closed.ok()) {
            fail(ArchiveErrorKind::Storage, "segment flush failed", closed.error_code);
        }
    }
    descriptor_.end_position = frontier_->position;
    descriptor_.end_timestamp = clock_.epoch_ms();
    descriptor_.state = RecordingState::Closed;
    frontier_->stopped = true;
    activation_pending_ = false;
    state_ = RecordingSessionState::Stopped;
    LOG_SLOW_INFO(kComponent, "recording %lld stopped: join=%lld end=%lld%s",
                  static_cast<long long>(descriptor_.recording_id), static_cast<long long>(descriptor_.join_position),
                  static_cast<long long>(descriptor_.end_position), error_ ? " (error)" : "");
}

} // namespace archive
