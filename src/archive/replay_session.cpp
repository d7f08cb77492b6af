#include "archive/replay_session.hpp"

#include <algorithm>
#include <limits>

#include "archive/channel.hpp"
#include "archive/frame.hpp"
#include "archive/position.hpp"
#include "util/log.hpp"

namespace archive {

namespace {
constexpr const char* kComponent = "replay";
constexpr auto kStallLogInterval = std::chrono::seconds{1};
}

const char* replay_state_name(ReplayState s) noexcept {
    switch (s) {
    case ReplayState::Init: return "INIT";
    case ReplayState::Connecting: return "CONNECTING";
    case ReplayState::Replaying: return "REPLAYING";
    case ReplayState::Completed: return "COMPLETED";
    case ReplayState::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

ReplayValidation validate_replay(const std::optional<RecordingDescriptor>& descriptor,
                                 const FrontierRef& frontier,
                                 std::int64_t recording_id,
                                 std::int64_t position,
                                 std::int64_t length) {
    ReplayValidation v;
    if (!descriptor || descriptor->state == RecordingState::Provisional) {
        v.error = {ArchiveErrorKind::RecordingNotFound, "unknown recording " + std::to_string(recording_id)};
        return v;
    }
    const RecordingDescriptor& d = *descriptor;
    if (!d.is_closed() && !frontier) {
        v.error = {ArchiveErrorKind::ReplayRangeInvalid,
                   "recording " + std::to_string(recording_id) + " is open but not being recorded"};
        return v;
    }
    const std::int64_t durable = d.is_closed() ? d.end_position : frontier->position;
    const std::int64_t from = position == null_position ? d.join_position : position;
    if (from < d.join_position) {
        v.error = {ArchiveErrorKind::ReplayRangeInvalid, "position " + std::to_string(from) +
                                                             " is before join position " +
                                                             std::to_string(d.join_position)};
        return v;
    }
    if (from > durable) {
        v.error = {ArchiveErrorKind::ReplayRangeInvalid, "position " + std::to_string(from) +
                                                             " is past recorded position " + std::to_string(durable)};
        return v;
    }
    v.start_position = std::max(align_down(from, frame::alignment), d.join_position);

    if (length < 0) {
        v.limit_position = d.is_closed() ? d.end_position : null_position;
        return v;
    }
    if (length > std::numeric_limits<std::int64_t>::max() - from || from + length > durable) {
        v.error = {ArchiveErrorKind::ReplayRangeInvalid, "range [" + std::to_string(from) + ", +" +
                                                             std::to_string(length) + ") ends past recorded position " +
                                                             std::to_string(durable)};
        return v;
    }
    v.limit_position = from + length;
    return v;
}

ReplaySession::ReplaySession(std::int64_t replay_id,
                             std::int64_t correlation_id,
                             std::int64_t control_session_id,
                             RecordingDescriptor descriptor,
                             FrontierRef frontier,
                             const ReplayValidation& range,
                             std::string replay_channel,
                             std::int32_t replay_stream_id,
                             transport::AeronClientView& client,
                             persist::SegmentStore& store,
                             ReplayOptions options,
                             const util::SteadyClock& clock)
    : replay_id_(replay_id),
      correlation_id_(correlation_id),
      control_session_id_(control_session_id),
      descriptor_(std::move(descriptor)),
      frontier_(std::move(frontier)),
      replay_position_(range.start_position),
      limit_position_(range.limit_position),
      replay_channel_(std::move(replay_channel)),
      replay_stream_id_(replay_stream_id),
      client_(client),
      store_(store),
      options_(options),
      clock_(clock),
      stall_log_(kStallLogInterval) {
    const auto max_frame = static_cast<std::int32_t>(align(descriptor_.mtu_length, frame::alignment));
    buffer_.resize(static_cast<std::size_t>(std::max(options_.block_length, max_frame)));
}

ReplaySession::~ReplaySession() { close_segment(); }

std::int64_t ReplaySession::remaining() const noexcept {
    if (limit_position_ == null_position) {
        return null_length;
    }
    return std::max<std::int64_t>(0, limit_position_ - replay_position_);
}

int ReplaySession::do_work() {
    if (is_done()) {
        return 0;
    }
    if (stop_requested_) {
        LOG_SLOW_INFO(kComponent, "replay %lld stopped by request at %lld", static_cast<long long>(replay_id_),
                      static_cast<long long>(replay_position_));
        state_ = ReplayState::Aborted;
        close_segment();
        return 1;
    }
    switch (state_) {
    case ReplayState::Init: return init();
    case ReplayState::Connecting: return await_connection();
    case ReplayState::Replaying: return replay();
    default: return 0;
    }
}

int ReplaySession::init() {
    if (!locate_frame_start()) {
        return 1;
    }
    const auto channel = make_replay_channel(replay_channel_, descriptor_, replay_position_);
    if (!channel) {
        abort(ArchiveErrorKind::Protocol, "invalid replay channel " + replay_channel_);
        return 1;
    }
    registration_id_ = client_.add_exclusive_publication(*channel, replay_stream_id_);
    if (registration_id_ < 0) {
        abort(ArchiveErrorKind::DownstreamLost, "replay publication could not be added");
        return 1;
    }
    connect_deadline_ = clock_.now() + options_.connect_timeout;
    state_ = ReplayState::Connecting;
    LOG_SLOW_DEBUG(kComponent, "replay %lld publishing on %s stream %d", static_cast<long long>(replay_id_),
                   channel->c_str(), replay_stream_id_);
    return 1;
}

int ReplaySession::await_connection() {
    if (!publication_) {
        auto found = client_.find_exclusive_publication(registration_id_);
        if (found.failed) {
            abort(ArchiveErrorKind::DownstreamLost, "replay publication failed: " + found.error);
            return 1;
        }
        publication_ = std::move(found.resource);
    }
    if (publication_ && publication_->is_connected()) {
        state_ = ReplayState::Replaying;
        LOG_SLOW_INFO(kComponent, "replay %lld of recording %lld from %lld connected",
                      static_cast<long long>(replay_id_), static_cast<long long>(descriptor_.recording_id),
                      static_cast<long long>(replay_position_));
        return 1;
    }
    if (clock_.now() >= connect_deadline_) {
        abort(ArchiveErrorKind::DownstreamLost, "no subscriber connected within " +
                                                    std::to_string(options_.connect_timeout.count()) + "ms");
        return 1;
    }
    return 0;
}

std::int64_t ReplaySession::durable_limit() const noexcept {
    if (frontier_) {
        return frontier_->position;
    }
    return descriptor_.end_position;
}

int ReplaySession::replay() {
    if (publication_->is_closed()) {
        abort(ArchiveErrorKind::DownstreamLost, "replay publication closed");
        return 1;
    }
    if (limit_position_ != null_position && replay_position_ >= limit_position_) {
        state_ = ReplayState::Completed;
        close_segment();
        LOG_SLOW_INFO(kComponent, "replay %lld completed at %lld", static_cast<long long>(replay_id_),
                      static_cast<long long>(replay_position_));
        return 1;
    }
    const std::int64_t durable = durable_limit();
    if (replay_position_ >= durable) {
        const bool recording_over = !frontier_ || frontier_->stopped;
        if (limit_position_ == null_position && recording_over) {
            state_ = ReplayState::Completed;
            close_segment();
            LOG_SLOW_INFO(kComponent, "replay %lld followed recording to its end at %lld",
                          static_cast<long long>(replay_id_), static_cast<long long>(replay_position_));
            return 1;
        }
        if (recording_over) {
            abort(ArchiveErrorKind::Storage, "recording stopped at " + std::to_string(durable) +
                                                 " before the requested range was written");
            return 1;
        }
        // Caught up with a live recording; park until more is durable.
        return 0;
    }
    return send_frames(durable);
}

int ReplaySession::send_frames(std::int64_t durable) {
    if (!ensure_segment(replay_position_)) {
        return 1;
    }
    const std::int64_t segment_offset = replay_position_ - segment_->base_position();
    const std::int64_t window = std::min({static_cast<std::int64_t>(buffer_.size()),
                                          term_remaining(replay_position_, descriptor_.term_buffer_length),
                                          descriptor_.segment_file_length - segment_offset,
                                          durable - replay_position_});
    const std::span<std::byte> bytes(buffer_.data(), static_cast<std::size_t>(window));
    const persist::StoreResult read = store_.read(*segment_, segment_offset, bytes);
    if (!read.ok()) {
        abort(ArchiveErrorKind::Storage, std::string("segment read failed: ") + persist::store_status_name(read.status),
              read.error_code);
        return 1;
    }

    const std::int64_t target = limit_position_ == null_position ? durable : limit_position_;
    std::int64_t batch = 0;
    while (batch + frame::header_length <= window) {
        std::byte* frame_ptr = buffer_.data() + batch;
        const std::int32_t length = frame::frame_length(frame_ptr);
        if (!is_valid_frame_length(length, replay_position_ + batch)) {
            abort(ArchiveErrorKind::Storage,
                  "invalid frame length " + std::to_string(length) + " at " + std::to_string(replay_position_ + batch));
            return 1;
        }
        const std::int64_t aligned = frame::aligned_length(length);
        if (frame::is_padding(frame_ptr)) {
            // Padding goes out alone; its body is never read, only its extent must be durable.
            if (batch > 0) {
                break;
            }
            if (replay_position_ + aligned > durable) {
                return 0;
            }
            const std::int64_t result = publication_->append_padding(length - frame::header_length);
            if (result < 0) {
                return handle_offer_failure(result) ? 0 : 1;
            }
            stalled_since_.reset();
            replay_position_ += aligned;
            return static_cast<int>(aligned);
        }
        if (batch + aligned > window) {
            break;
        }
        frame::set_stream_id(frame_ptr, replay_stream_id_);
        batch += aligned;
        if (replay_position_ + batch >= target) {
            break;
        }
    }
    if (batch == 0) {
        abort(ArchiveErrorKind::Storage, "frame at " + std::to_string(replay_position_) + " exceeds the read window");
        return 1;
    }

    const std::int64_t result = publication_->offer_block(bytes.first(static_cast<std::size_t>(batch)));
    if (result < 0) {
        return handle_offer_failure(result) ? 0 : 1;
    }
    stalled_since_.reset();
    replay_position_ += batch;
    return static_cast<int>(batch);
}

// A requested position may fall inside a frame. Walk the headers of its term, from the term
// start or the join position, and begin at the frame that contains it.
bool ReplaySession::locate_frame_start() {
    const std::int64_t target = replay_position_;
    std::int64_t position = std::max(term_base_position(target, descriptor_.term_buffer_length),
                                     descriptor_.join_position);
    while (position < target) {
        if (!ensure_segment(position)) {
            return false;
        }
        const std::int64_t window = std::min(static_cast<std::int64_t>(buffer_.size()), target - position);
        const std::span<std::byte> bytes(buffer_.data(), static_cast<std::size_t>(window));
        const persist::StoreResult read = store_.read(*segment_, position - segment_->base_position(), bytes);
        if (!read.ok()) {
            abort(ArchiveErrorKind::Storage,
                  std::string("segment read failed: ") + persist::store_status_name(read.status), read.error_code);
            return false;
        }
        std::int64_t offset = 0;
        while (offset + frame::header_length <= window) {
            const std::int32_t length = frame::frame_length(buffer_.data() + offset);
            if (!is_valid_frame_length(length, position + offset)) {
                abort(ArchiveErrorKind::Storage, "invalid frame length " + std::to_string(length) + " at " +
                                                     std::to_string(position + offset));
                return false;
            }
            const std::int64_t next = position + offset + frame::aligned_length(length);
            if (next > target) {
                replay_position_ = position + offset;
                return true;
            }
            offset = next - position;
        }
        position += offset;
    }
    replay_position_ = position;
    return true;
}

bool ReplaySession::is_valid_frame_length(std::int32_t length, std::int64_t position) const noexcept {
    return length >= frame::header_length && length <= term_remaining(position, descriptor_.term_buffer_length);
}

bool ReplaySession::ensure_segment(std::int64_t position) {
    const std::int64_t index = segment_index(position, descriptor_.segment_file_length);
    if (segment_ && segment_->segment_index() == index) {
        return true;
    }
    close_segment();
    const persist::SegmentGeometry geometry{descriptor_.segment_file_length, descriptor_.term_buffer_length};
    const persist::StoreResult opened = store_.open_for_read(descriptor_.recording_id, index, geometry, segment_);
    if (!opened.ok()) {
        abort(ArchiveErrorKind::Storage,
              std::string("segment open failed: ") + persist::store_status_name(opened.status), opened.error_code);
        return false;
    }
    return true;
}

bool ReplaySession::handle_offer_failure(std::int64_t result) {
    if (result == transport::back_pressured || result == transport::admin_action) {
        const auto now = clock_.now();
        if (!stalled_since_) {
            stalled_since_ = now;
            return true;
        }
        if (options_.stall_timeout.count() > 0 && now - *stalled_since_ >= options_.stall_timeout) {
            abort(ArchiveErrorKind::DownstreamLost,
                  "subscriber stalled for " + std::to_string(options_.stall_timeout.count()) + "ms");
            return false;
        }
        if (now - *stalled_since_ >= kStallLogInterval && stall_log_.admit(now)) {
            LOG_SLOW_WARN(kComponent, "replay %lld back-pressured at %lld for %lld ms",
                          static_cast<long long>(replay_id_), static_cast<long long>(replay_position_),
                          static_cast<long long>(
                              std::chrono::duration_cast<std::chrono::milliseconds>(now - *stalled_since_).count()));
        }
        return true;
    }
    abort(ArchiveErrorKind::DownstreamLost, std::string("downstream lost: ") + transport::offer_result_name(result));
    return false;
}

void ReplaySession::abort(ArchiveErrorKind kind, std::string message, int error_code) {
    LOG_SLOW_WARN(kComponent, "replay %lld of recording %lld aborted at %lld: %s", static_cast<long long>(replay_id_),
                  static_cast<long long>(descriptor_.recording_id), static_cast<long long>(replay_position_),
                  message.c_str());
    error_ = ArchiveError{kind, std::move(message), error_code};
    state_ = ReplayState::Aborted;
    close_segment();
}

void ReplaySession::close_segment() {
    if (segment_) {
        const persist::StoreResult closed = store_.close(*segment_);
        if (!closed.ok()) {
            LOG_SLOW_WARN(kComponent, "replay %lld failed to close segment: %s (%d)", static_cast<long long>(replay_id_),
                          persist::store_status_name(closed.status), closed.error_code);
        }
        segment_.reset();
    }
}

} // namespace archive
