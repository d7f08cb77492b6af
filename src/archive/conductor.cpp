#include "archive/conductor.hpp"

#include <algorithm>
#include <thread>

#include "archive/channel.hpp"
#include "util/byte_order.hpp"
#include "util/log.hpp"

namespace archive {

namespace {

constexpr const char* kComponent = "conductor";
constexpr int kSpinsBeforeSleep = 32;

} // namespace

Conductor::Conductor(ArchiveConfig config,
                     std::shared_ptr<transport::AeronClientView> client,
                     const util::SteadyClock& steady_clock,
                     const util::SystemClock& system_clock,
                     persist::FileFactory file_factory)
    : config_(std::move(config)),
      client_(std::move(client)),
      steady_clock_(steady_clock),
      system_clock_(system_clock),
      store_(config_.archive_dir,
             persist::SegmentSyncPolicy{config_.file_sync_level, config_.sync_interval_bytes},
             file_factory),
      catalog_(config_.archive_dir, config_.catalog_sync, file_factory),
      events_(config_.control_response_queue_limit) {
    control_handler_ = [this](std::span<const std::byte> message, std::int32_t session_id) {
        on_fragment(message, session_id);
    };
}

Conductor::~Conductor() { close(); }

bool Conductor::start() {
    const persist::CatalogStatus opened = catalog_.open();
    if (opened != persist::CatalogStatus::Ok) {
        LOG_SLOW_ERROR(kComponent, "cannot open catalog in %s: %s", config_.archive_dir.c_str(),
                       persist::catalog_status_name(opened));
        return false;
    }
    recover_unfinished_recordings();

    control_registration_id_ = client_->add_subscription(config_.control_channel, config_.control_stream_id);
    events_registration_id_ =
        client_->add_publication(config_.recording_events_channel, config_.recording_events_stream_id);
    if (control_registration_id_ < 0 || events_registration_id_ < 0) {
        LOG_SLOW_ERROR(kComponent, "cannot register control plane");
        return false;
    }
    started_ = true;
    LOG_SLOW_INFO(kComponent,
                  "archive %s started: control=%s stream=%d events=%s stream=%d next recording id=%lld",
                  config_.archive_dir.c_str(), config_.control_channel.c_str(), config_.control_stream_id,
                  config_.recording_events_channel.c_str(), config_.recording_events_stream_id,
                  static_cast<long long>(catalog_.next_recording_id()));
    return true;
}

void Conductor::recover_unfinished_recordings() {
    for (auto descriptor : catalog_.unfinished()) {
        std::int64_t end_position = descriptor.join_position;
        // Bare placeholders from allocate() carry no geometry and never wrote a segment.
        if (is_power_of_two(descriptor.segment_file_length) && is_power_of_two(descriptor.term_buffer_length)) {
            const persist::StoreResult scanned = store_.scan_recorded_position(descriptor, end_position);
            if (!scanned.ok()) {
                LOG_SLOW_ERROR(kComponent, "recording %lld: scan failed (%s), closing at join position",
                               static_cast<long long>(descriptor.recording_id),
                               persist::store_status_name(scanned.status));
                end_position = descriptor.join_position;
            }
        }
        descriptor.end_position = end_position;
        descriptor.end_timestamp = system_clock_.epoch_ms();
        descriptor.state = RecordingState::Closed;
        const persist::CatalogStatus put = catalog_.put(descriptor);
        if (put != persist::CatalogStatus::Ok) {
            LOG_SLOW_ERROR(kComponent, "recording %lld: cannot persist recovered descriptor: %s",
                           static_cast<long long>(descriptor.recording_id), persist::catalog_status_name(put));
            continue;
        }
        LOG_SLOW_WARN(kComponent, "recording %lld was left open, closed at %lld",
                      static_cast<long long>(descriptor.recording_id), static_cast<long long>(end_position));
    }
}

int Conductor::do_work() {
    if (!started_ || closed_) {
        return 0;
    }
    int work = 0;
    work += resolve_registrations();
    work += poll_control();
    work += service_control_sessions();
    work += poll_images();
    work += service_recordings();
    work += service_replays();
    work += service_listings();
    work += events_.do_work();
    return work;
}

void Conductor::run(const std::atomic<bool>& stop_flag) {
    int idle_count = 0;
    while (!stop_flag.load(std::memory_order_acquire) && !failed_) {
        if (do_work() > 0) {
            idle_count = 0;
            continue;
        }
        if (idle_count < kSpinsBeforeSleep) {
            ++idle_count;
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(config_.idle_sleep);
        }
    }
    close();
}

void Conductor::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& [id, replay] : replays_) {
        replay->request_stop();
        replay->do_work();
    }
    replays_.clear();
    for (auto& [id, recording] : recordings_) {
        recording->request_stop();
        while (!recording->is_done()) {
            recording->do_work();
        }
        on_recording_stopped(*recording);
    }
    recordings_.clear();
    listings_.clear();
    subscriptions_.clear();
    retired_subscriptions_.clear();
    events_.do_work();
    control_sessions_.clear();
    control_session_by_transport_.clear();
    catalog_.close();
    if (started_) {
        LOG_SLOW_INFO(kComponent, "archive %s closed", config_.archive_dir.c_str());
    }
}

const RecordingSession* Conductor::find_recording(std::int64_t recording_id) const {
    const auto it = recordings_.find(recording_id);
    return it == recordings_.end() ? nullptr : it->second.get();
}

const ReplaySession* Conductor::find_replay(std::int64_t replay_id) const {
    const auto it = replays_.find(replay_id);
    return it == replays_.end() ? nullptr : it->second.get();
}

int Conductor::resolve_registrations() {
    int work = 0;
    if (!control_subscription_) {
        auto found = client_->find_subscription(control_registration_id_);
        if (found.failed) {
            LOG_SLOW_FATAL(kComponent, "control subscription failed: %s", found.error.c_str());
            failed_ = true;
            return 0;
        }
        if (found.resource) {
            control_subscription_ = std::move(found.resource);
            ++work;
        }
    }
    if (!events_.has_publication()) {
        auto found = client_->find_publication(events_registration_id_);
        if (found.failed) {
            LOG_SLOW_FATAL(kComponent, "recording events publication failed: %s", found.error.c_str());
            failed_ = true;
            return 0;
        }
        if (found.resource) {
            events_.set_publication(std::move(found.resource));
            ++work;
        }
    }
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        RecordingSubscription& sub = it->second;
        if (sub.subscription) {
            ++it;
            continue;
        }
        auto found = client_->find_subscription(sub.registration_id);
        if (found.failed) {
            LOG_SLOW_ERROR(kComponent, "recording subscription %s stream %d failed: %s", sub.channel.c_str(),
                           sub.stream_id, found.error.c_str());
            it = subscriptions_.erase(it);
            ++work;
            continue;
        }
        if (found.resource) {
            sub.subscription = std::move(found.resource);
            ++work;
        }
        ++it;
    }
    return work;
}

int Conductor::poll_control() {
    if (!control_subscription_) {
        return 0;
    }
    return control_subscription_->poll(control_handler_, config_.control_fragment_limit);
}

void Conductor::on_fragment(std::span<const std::byte> message, std::int32_t session_id) {
    control::ControlRequest request;
    const control::DecodeStatus status = control::decode_request(message, request);
    if (status != control::DecodeStatus::Ok) {
        LOG_SLOW_WARN(kComponent, "session %d: undecodable request (%s, %zu bytes)", session_id,
                      control::decode_status_name(status), message.size());
        // Every request but Connect leads with its correlation id.
        control::ControlSession* session = find_connected_session(session_id);
        if (session && message.size() >= control::message_header_length + 8 &&
            util::load_le16(message.data()) != static_cast<std::uint16_t>(control::TemplateId::Connect)) {
            const std::int64_t correlation_id = util::load_i64(message.data() + control::message_header_length);
            respond(*session, control::ControlResult{correlation_id, control::ResponseCode::Error,
                                                     std::string("malformed request: ") +
                                                         control::decode_status_name(status)});
        }
        return;
    }

    std::visit(control::Overloaded{
                   [&](const control::ConnectRequest& r) { on_request(session_id, r); },
                   [&](const auto& r) {
                       control::ControlSession* session = find_connected_session(session_id);
                       if (!session) {
                           LOG_SLOW_WARN(kComponent, "request from unconnected session %d dropped", session_id);
                           return;
                       }
                       on_request(*session, r);
                   },
               },
               request);
}

control::ControlSession* Conductor::find_control_session(std::int64_t control_session_id) {
    const auto it = control_sessions_.find(control_session_id);
    if (it == control_sessions_.end() || it->second->is_closed()) {
        return nullptr;
    }
    return it->second.get();
}

control::ControlSession* Conductor::find_connected_session(std::int32_t transport_session_id) {
    const auto it = control_session_by_transport_.find(transport_session_id);
    return it == control_session_by_transport_.end() ? nullptr : find_control_session(it->second);
}

void Conductor::respond(control::ControlSession& session, const control::ControlResponse& response) {
    if (!session.send(response)) {
        LOG_SLOW_WARN(kComponent, "session %lld: response for correlation %lld not delivered",
                      static_cast<long long>(session.id()),
                      static_cast<long long>(control::correlation_id_of(response)));
    }
}

void Conductor::on_request(std::int32_t session_id, const control::ConnectRequest& request) {
    if (find_connected_session(session_id)) {
        LOG_SLOW_WARN(kComponent, "transport session %d already connected, ignoring Connect", session_id);
        return;
    }
    const std::int64_t id = next_control_session_id_++;
    control_sessions_.emplace(id, std::make_unique<control::ControlSession>(
                                      id, request.response_channel, request.response_stream_id, *client_,
                                      config_.control_response_queue_limit, steady_clock_,
                                      config_.control_session_liveness_timeout));
    control_session_by_transport_[session_id] = id;
    LOG_SLOW_INFO(kComponent, "session %lld connected from transport session %d, responses on %s stream %d",
                  static_cast<long long>(id), session_id, request.response_channel.c_str(),
                  request.response_stream_id);
}

void Conductor::on_request(control::ControlSession& session, const control::StartRecordingRequest& request) {
    const std::string stripped = strip_channel(request.channel);
    if (stripped.empty()) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "invalid channel " + request.channel});
        return;
    }
    RecordingKey key{stripped, request.stream_id};
    if (subscriptions_.count(key) != 0) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::DuplicateRecording,
                                                "already recording " + stripped + " stream " +
                                                    std::to_string(request.stream_id)});
        return;
    }
    if (recordings_.size() >= config_.max_concurrent_recordings) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "max concurrent recordings reached"});
        return;
    }
    const std::int64_t registration_id = client_->add_subscription(request.channel, request.stream_id);
    if (registration_id < 0) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "cannot subscribe to " + request.channel});
        return;
    }
    RecordingSubscription sub;
    sub.registration_id = registration_id;
    sub.channel = request.channel;
    sub.stripped_channel = stripped;
    sub.stream_id = request.stream_id;
    subscriptions_.emplace(std::move(key), std::move(sub));
    LOG_SLOW_INFO(kComponent, "recording requested for %s stream %d", request.channel.c_str(), request.stream_id);
    respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Ok, {}});
}

void Conductor::on_request(control::ControlSession& session, const control::StopRecordingRequest& request) {
    const auto it = subscriptions_.find(RecordingKey{strip_channel(request.channel), request.stream_id});
    if (it == subscriptions_.end()) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::RecordingUnknown,
                                                "no recording for " + request.channel + " stream " +
                                                    std::to_string(request.stream_id)});
        return;
    }
    for (const auto recording_id : it->second.recording_ids) {
        if (auto rec = recordings_.find(recording_id); rec != recordings_.end()) {
            rec->second->request_stop();
        }
    }
    retired_subscriptions_.push_back(std::move(it->second));
    subscriptions_.erase(it);
    respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Ok, {}});
}

void Conductor::on_request(control::ControlSession& session, const control::ReplayRequest& request) {
    if (replays_.size() >= config_.max_concurrent_replays) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "max concurrent replays reached"});
        return;
    }
    const auto descriptor = catalog_.get(request.recording_id);
    FrontierRef frontier;
    if (const auto it = recordings_.find(request.recording_id); it != recordings_.end()) {
        frontier = it->second->frontier();
    }
    // The catalog copy of a live recording may still read PROVISIONAL; the session's is current.
    std::optional<RecordingDescriptor> current = descriptor;
    if (current && frontier) {
        current->state = RecordingState::Active;
    }
    const ReplayValidation validation =
        validate_replay(current, frontier, request.recording_id, request.position, request.length);
    if (validation.error.kind == ArchiveErrorKind::RecordingNotFound) {
        respond(session, control::RecordingNotFound{request.correlation_id, request.recording_id,
                                                    catalog_.highest_assigned_id()});
        return;
    }
    if (validation.error) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                validation.error.message});
        return;
    }
    if (!parse_channel(request.replay_channel)) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "invalid replay channel " + request.replay_channel});
        return;
    }

    const std::int64_t replay_id = next_replay_id_++;
    const ReplayOptions options{config_.replay_block_length, config_.replay_connect_timeout,
                                config_.replay_stall_timeout};
    replays_.emplace(replay_id, std::make_unique<ReplaySession>(replay_id, request.correlation_id, session.id(),
                                                                *current, frontier, validation,
                                                                request.replay_channel, request.replay_stream_id,
                                                                *client_, store_, options, steady_clock_));
    LOG_SLOW_INFO(kComponent, "replay %lld of recording %lld [%lld, %lld) to %s stream %d",
                  static_cast<long long>(replay_id), static_cast<long long>(request.recording_id),
                  static_cast<long long>(validation.start_position),
                  static_cast<long long>(validation.limit_position), request.replay_channel.c_str(),
                  request.replay_stream_id);
    respond(session, control::ReplayStarted{request.correlation_id, replay_id});
}

void Conductor::on_request(control::ControlSession& session, const control::StopReplayRequest& request) {
    const auto it = replays_.find(request.replay_id);
    if (it == replays_.end()) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "unknown replay " + std::to_string(request.replay_id)});
        return;
    }
    it->second->request_stop();
    respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Ok, {}});
}

void Conductor::on_request(control::ControlSession& session, const control::ListRecordingsRequest& request) {
    if (request.record_count <= 0) {
        respond(session, control::ControlResult{request.correlation_id, control::ResponseCode::Error,
                                                "record count must be positive"});
        return;
    }
    listings_.push_back(std::make_unique<ListRecordingsSession>(request.correlation_id, request.from_recording_id,
                                                                request.record_count, catalog_, session,
                                                                config_.list_recordings_batch));
}

int Conductor::service_control_sessions() {
    int work = 0;
    for (auto it = control_sessions_.begin(); it != control_sessions_.end();) {
        control::ControlSession& session = *it->second;
        work += session.do_work();
        if (!session.is_closed()) {
            ++it;
            continue;
        }
        const std::int64_t id = session.id();
        for (auto l = listings_.begin(); l != listings_.end();) {
            l = (*l)->control_session_id() == id ? listings_.erase(l) : std::next(l);
        }
        for (auto t = control_session_by_transport_.begin(); t != control_session_by_transport_.end();) {
            t = t->second == id ? control_session_by_transport_.erase(t) : std::next(t);
        }
        LOG_SLOW_INFO(kComponent, "session %lld closed, %llu responses dropped", static_cast<long long>(id),
                      static_cast<unsigned long long>(session.dropped()));
        it = control_sessions_.erase(it);
        ++work;
    }
    return work;
}

int Conductor::poll_images() {
    int work = 0;
    for (auto& [key, sub] : subscriptions_) {
        if (!sub.subscription) {
            continue;
        }
        const std::size_t count = sub.subscription->image_count();
        for (std::size_t i = 0; i < count; ++i) {
            auto image = sub.subscription->image_at(i);
            if (!image || sub.known_images.count(image->correlation_id()) != 0) {
                continue;
            }
            sub.known_images.insert(image->correlation_id());
            if (image->is_closed()) {
                continue;
            }
            start_recording_session(sub, std::move(image));
            ++work;
        }
    }
    return work;
}

void Conductor::start_recording_session(RecordingSubscription& sub, std::shared_ptr<transport::ImageView> image) {
    if (recordings_.size() >= config_.max_concurrent_recordings) {
        LOG_SLOW_WARN(kComponent, "max concurrent recordings reached, image %d on %s stream %d not recorded",
                      image->session_id(), sub.channel.c_str(), sub.stream_id);
        return;
    }
    const std::int32_t term_length = image->term_buffer_length();
    if (!is_power_of_two(term_length)) {
        LOG_SLOW_ERROR(kComponent, "image %d has invalid term length %d", image->session_id(), term_length);
        return;
    }

    std::int64_t recording_id = null_value;
    const persist::CatalogStatus allocated = catalog_.allocate(recording_id);
    if (allocated != persist::CatalogStatus::Ok) {
        LOG_SLOW_ERROR(kComponent, "cannot allocate recording id: %s", persist::catalog_status_name(allocated));
        return;
    }

    RecordingDescriptor descriptor;
    descriptor.recording_id = recording_id;
    descriptor.join_timestamp = system_clock_.epoch_ms();
    descriptor.join_position = image->position();
    descriptor.initial_term_id = image->initial_term_id();
    descriptor.segment_file_length = std::max(config_.segment_file_length, term_length);
    descriptor.term_buffer_length = term_length;
    descriptor.mtu_length = image->mtu_length();
    descriptor.session_id = image->session_id();
    descriptor.stream_id = sub.stream_id;
    descriptor.stripped_channel = sub.stripped_channel;
    descriptor.original_channel = sub.channel;
    descriptor.source_identity = image->source_identity();
    descriptor.state = RecordingState::Provisional;

    const persist::CatalogStatus put = catalog_.put(descriptor);
    if (put != persist::CatalogStatus::Ok) {
        LOG_SLOW_ERROR(kComponent, "recording %lld: cannot persist descriptor: %s",
                       static_cast<long long>(recording_id), persist::catalog_status_name(put));
        return;
    }

    events_.started(control::RecordingStarted{recording_id, descriptor.join_position, descriptor.session_id,
                                              descriptor.stream_id, descriptor.original_channel,
                                              descriptor.source_identity});
    sub.recording_ids.insert(recording_id);
    recordings_.emplace(recording_id, std::make_unique<RecordingSession>(std::move(descriptor), std::move(image),
                                                                         store_, config_.recording_block_length,
                                                                         system_clock_));
}

int Conductor::service_recordings() {
    int work = 0;
    for (auto it = recordings_.begin(); it != recordings_.end();) {
        RecordingSession& session = *it->second;
        work += session.do_work();
        if (auto active = session.take_activated()) {
            const persist::CatalogStatus put = catalog_.put(*active);
            if (put != persist::CatalogStatus::Ok) {
                LOG_SLOW_ERROR(kComponent, "recording %lld: cannot persist ACTIVE descriptor: %s",
                               static_cast<long long>(session.recording_id()), persist::catalog_status_name(put));
            }
        }
        if (session.is_done()) {
            on_recording_stopped(session);
            it = recordings_.erase(it);
            ++work;
            continue;
        }
        events_.progress(session.recording_id(), session.join_position(), session.recorded_position());
        ++it;
    }

    for (auto it = retired_subscriptions_.begin(); it != retired_subscriptions_.end();) {
        const bool draining = std::any_of(it->recording_ids.begin(), it->recording_ids.end(),
                                          [this](std::int64_t id) { return recordings_.count(id) != 0; });
        it = draining ? std::next(it) : retired_subscriptions_.erase(it);
    }
    return work;
}

void Conductor::on_recording_stopped(RecordingSession& session) {
    const RecordingDescriptor& closed = session.descriptor();
    const persist::CatalogStatus put = catalog_.put(closed);
    if (put != persist::CatalogStatus::Ok) {
        LOG_SLOW_ERROR(kComponent, "recording %lld: cannot persist CLOSED descriptor: %s",
                       static_cast<long long>(closed.recording_id), persist::catalog_status_name(put));
    }
    if (session.error()) {
        events_.error(control::RecordingError{closed.recording_id, closed.end_position, session.error().message});
    }
    events_.stopped(control::RecordingStopped{closed.recording_id, closed.join_position, closed.end_position});
}

int Conductor::service_replays() {
    int work = 0;
    for (auto it = replays_.begin(); it != replays_.end();) {
        ReplaySession& replay = *it->second;
        work += replay.do_work();
        if (!replay.is_done()) {
            ++it;
            continue;
        }
        if (replay.state() == ReplayState::Aborted) {
            if (control::ControlSession* session = find_control_session(replay.control_session_id())) {
                respond(*session, control::ReplayAborted{replay.correlation_id(), replay.replay_position()});
            }
        }
        it = replays_.erase(it);
        ++work;
    }
    return work;
}

int Conductor::service_listings() {
    int work = 0;
    for (auto it = listings_.begin(); it != listings_.end();) {
        work += (*it)->do_work();
        it = (*it)->is_done() ? listings_.erase(it) : std::next(it);
    }
    return work;
}

} // namespace archive
