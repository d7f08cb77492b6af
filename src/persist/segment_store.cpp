#include "persist/segment_store.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <system_error>

#include "archive/frame.hpp"
#include "archive/position.hpp"
#include "util/log.hpp"

namespace persist {

namespace {

constexpr const char* kComponent = "segment-store";
constexpr std::string_view kSegmentSuffix = ".rec";

bool parse_segment_file_name(std::string_view name, std::int64_t& recording_id, std::int64_t& segment_index) {
    if (name.size() <= kSegmentSuffix.size() ||
        name.substr(name.size() - kSegmentSuffix.size()) != kSegmentSuffix) {
        return false;
    }
    const std::string_view stem = name.substr(0, name.size() - kSegmentSuffix.size());
    const auto dash = stem.find('-');
    if (dash == std::string_view::npos) {
        return false;
    }
    const auto id_part = stem.substr(0, dash);
    const auto idx_part = stem.substr(dash + 1);
    auto r1 = std::from_chars(id_part.data(), id_part.data() + id_part.size(), recording_id);
    if (r1.ec != std::errc() || r1.ptr != id_part.data() + id_part.size()) {
        return false;
    }
    auto r2 = std::from_chars(idx_part.data(), idx_part.data() + idx_part.size(), segment_index);
    return r2.ec == std::errc() && r2.ptr == idx_part.data() + idx_part.size();
}

} // namespace

const char* store_status_name(StoreStatus s) noexcept {
    switch (s) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::IoError: return "io_error";
    case StoreStatus::OutOfBounds: return "out_of_bounds";
    case StoreStatus::SpansTerm: return "spans_term";
    case StoreStatus::NonSequential: return "non_sequential";
    case StoreStatus::Sealed: return "sealed";
    case StoreStatus::NotFound: return "not_found";
    case StoreStatus::AlreadyExists: return "already_exists";
    }
    return "unknown";
}

SegmentStore::SegmentStore(std::filesystem::path archive_dir,
                           SegmentSyncPolicy sync_policy,
                           FileFactory file_factory)
    : archive_dir_(std::move(archive_dir)),
      sync_policy_(sync_policy),
      file_factory_(file_factory ? std::move(file_factory) : default_file_factory()) {}

std::string SegmentStore::segment_file_name(std::int64_t recording_id, std::int64_t segment_index) {
    return std::to_string(recording_id) + "-" + std::to_string(segment_index) + std::string(kSegmentSuffix);
}

std::filesystem::path SegmentStore::segment_path(std::int64_t recording_id, std::int64_t segment_index) const {
    return archive_dir_ / segment_file_name(recording_id, segment_index);
}

StoreResult SegmentStore::open(std::int64_t recording_id,
                               std::int64_t segment_index,
                               const SegmentGeometry& geometry,
                               std::unique_ptr<SegmentHandle>& out) {
    out.reset();
    std::error_code ec;
    std::filesystem::create_directories(archive_dir_, ec);
    if (ec) {
        return {StoreStatus::IoError, ec.value()};
    }

    auto file = file_factory_();
    const auto path = segment_path(recording_id, segment_index).string();
    const IoResult r = file->open(path, OpenMode::CreateExclusive);
    if (!r.ok) {
        if (r.error_code == EEXIST) {
            return {StoreStatus::AlreadyExists, r.error_code};
        }
        return {StoreStatus::IoError, r.error_code};
    }
    const IoResult t = file->truncate(static_cast<std::uint64_t>(geometry.segment_file_length));
    if (!t.ok) {
        file->close();
        return {StoreStatus::IoError, t.error_code};
    }

    auto handle = std::make_unique<SegmentHandle>();
    handle->file_ = std::move(file);
    handle->recording_id_ = recording_id;
    handle->segment_index_ = segment_index;
    handle->geometry_ = geometry;
    handle->writable_ = true;
    out = std::move(handle);
    LOG_SLOW_DEBUG(kComponent, "opened %s for write", path.c_str());
    return {};
}

StoreResult SegmentStore::open_for_read(std::int64_t recording_id,
                                        std::int64_t segment_index,
                                        const SegmentGeometry& geometry,
                                        std::unique_ptr<SegmentHandle>& out) {
    out.reset();
    auto file = file_factory_();
    const auto path = segment_path(recording_id, segment_index).string();
    const IoResult r = file->open(path, OpenMode::ReadOnly);
    if (!r.ok) {
        if (r.error_code == ENOENT) {
            return {StoreStatus::NotFound, r.error_code};
        }
        return {StoreStatus::IoError, r.error_code};
    }
    auto handle = std::make_unique<SegmentHandle>();
    handle->file_ = std::move(file);
    handle->recording_id_ = recording_id;
    handle->segment_index_ = segment_index;
    handle->geometry_ = geometry;
    out = std::move(handle);
    return {};
}

StoreResult SegmentStore::check_bounds(const SegmentHandle& handle, std::int64_t offset, std::size_t length) const noexcept {
    const auto len = static_cast<std::int64_t>(length);
    if (offset < 0 || offset + len > handle.geometry_.segment_file_length) {
        return {StoreStatus::OutOfBounds, EINVAL};
    }
    if (len > archive::term_remaining(offset, handle.geometry_.term_buffer_length)) {
        return {StoreStatus::SpansTerm, EINVAL};
    }
    return {};
}

StoreResult SegmentStore::write(SegmentHandle& handle, std::int64_t offset, std::span<const std::byte> bytes) noexcept {
    if (!handle.writable_ || !handle.file_ || !handle.file_->is_open()) {
        return {StoreStatus::IoError, EBADF};
    }
    if (handle.sealed_) {
        return {StoreStatus::Sealed, EINVAL};
    }
    const StoreResult bounds = check_bounds(handle, offset, bytes.size());
    if (!bounds.ok()) {
        return bounds;
    }
    if (handle.write_cursor_ >= 0 && offset != handle.write_cursor_) {
        return {StoreStatus::NonSequential, EINVAL};
    }

    const IoResult r = write_fully(*handle.file_, bytes, static_cast<std::uint64_t>(offset));
    if (!r.ok) {
        return {StoreStatus::IoError, r.error_code};
    }
    handle.write_cursor_ = offset + static_cast<std::int64_t>(bytes.size());
    handle.unsynced_bytes_ += bytes.size();

    const bool full = handle.write_cursor_ == handle.geometry_.segment_file_length;
    if (full) {
        handle.sealed_ = true;
    }

    bool want_sync = false;
    switch (sync_policy_.level) {
    case FileSyncLevel::None:
        break;
    case FileSyncLevel::EveryWrite:
        want_sync = true;
        break;
    case FileSyncLevel::Interval:
        want_sync = full || handle.unsynced_bytes_ >= sync_policy_.interval_bytes;
        break;
    }
    if (want_sync) {
        return sync(handle);
    }
    return {};
}

StoreResult SegmentStore::read(SegmentHandle& handle, std::int64_t offset, std::span<std::byte> out) noexcept {
    if (!handle.file_ || !handle.file_->is_open()) {
        return {StoreStatus::IoError, EBADF};
    }
    const StoreResult bounds = check_bounds(handle, offset, out.size());
    if (!bounds.ok()) {
        return bounds;
    }
    std::size_t got = 0;
    const IoResult r = read_fully(*handle.file_, out, static_cast<std::uint64_t>(offset), got);
    if (!r.ok) {
        return {StoreStatus::IoError, r.error_code};
    }
    if (got != out.size()) {
        return {StoreStatus::IoError, EIO};
    }
    return {};
}

StoreResult SegmentStore::sync(SegmentHandle& handle) noexcept {
    if (!handle.file_ || !handle.file_->is_open()) {
        return {StoreStatus::IoError, EBADF};
    }
    if (handle.unsynced_bytes_ == 0) {
        return {};
    }
    const IoResult r = handle.file_->sync();
    if (!r.ok) {
        return {StoreStatus::IoError, r.error_code};
    }
    handle.unsynced_bytes_ = 0;
    return {};
}

StoreResult SegmentStore::close(SegmentHandle& handle) noexcept {
    StoreResult result{};
    if (handle.writable_ && sync_policy_.level != FileSyncLevel::None && handle.file_ && handle.file_->is_open()) {
        result = sync(handle);
    }
    if (handle.file_) {
        handle.file_->close();
    }
    handle.writable_ = false;
    return result;
}

std::vector<std::int64_t> SegmentStore::segment_indices(std::int64_t recording_id) const {
    std::vector<std::int64_t> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(archive_dir_, ec)) {
        if (ec) {
            break;
        }
        if (!entry.is_regular_file()) {
            continue;
        }
        std::int64_t rid = 0;
        std::int64_t idx = 0;
        if (parse_segment_file_name(entry.path().filename().string(), rid, idx) && rid == recording_id) {
            out.push_back(idx);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

StoreResult SegmentStore::delete_recording(std::int64_t recording_id) {
    StoreResult result{};
    for (const auto idx : segment_indices(recording_id)) {
        std::error_code ec;
        std::filesystem::remove(segment_path(recording_id, idx), ec);
        if (ec) {
            LOG_SLOW_ERROR(kComponent, "failed to delete segment %lld-%lld: %s",
                           static_cast<long long>(recording_id), static_cast<long long>(idx), ec.message().c_str());
            result = {StoreStatus::IoError, ec.value()};
        }
    }
    return result;
}

StoreResult SegmentStore::scan_recorded_position(const archive::RecordingDescriptor& descriptor,
                                                 std::int64_t& out_position) {
    out_position = descriptor.join_position;
    const auto indices = segment_indices(descriptor.recording_id);
    if (indices.empty()) {
        return {};
    }
    const SegmentGeometry geometry{descriptor.segment_file_length, descriptor.term_buffer_length};
    const std::int64_t last = indices.back();
    const std::int64_t join_segment = archive::segment_index(descriptor.join_position, geometry.segment_file_length);
    if (last < join_segment) {
        return {};
    }

    std::unique_ptr<SegmentHandle> handle;
    const StoreResult opened = open_for_read(descriptor.recording_id, last, geometry, handle);
    if (!opened.ok()) {
        return opened;
    }

    const std::int64_t base = archive::segment_base_position(last, geometry.segment_file_length);
    std::int64_t offset = last == join_segment ? descriptor.join_position - base : 0;
    std::array<std::byte, archive::frame::header_length> header{};
    while (offset + archive::frame::header_length <= geometry.segment_file_length) {
        const StoreResult r = read(*handle, offset, header);
        if (!r.ok()) {
            close(*handle);
            return r;
        }
        const std::int32_t length = archive::frame::frame_length(header.data());
        // Zero is the unwritten tail; anything else out of range is a torn or corrupt frame.
        if (length < archive::frame::header_length ||
            length > archive::term_remaining(offset, geometry.term_buffer_length)) {
            break;
        }
        const std::int64_t aligned = archive::frame::aligned_length(length);
        if (offset + aligned > geometry.segment_file_length) {
            break;
        }
        offset += aligned;
    }
    close(*handle);
    out_position = base + offset;
    return {};
}

} // namespace persist
