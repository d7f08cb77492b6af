#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "archive/recording_descriptor.hpp"
#include "persist/random_access_file.hpp"

namespace persist {

enum class FileSyncLevel : std::uint8_t {
    None = 0,        // rely on the OS to flush eventually
    EveryWrite = 1,  // fdatasync after every write
    Interval = 2,    // fdatasync once sync_interval_bytes have accumulated
};

struct SegmentSyncPolicy {
    FileSyncLevel level{FileSyncLevel::None};
    std::uint64_t interval_bytes{16ULL * 1024 * 1024};
};

enum class StoreStatus {
    Ok = 0,
    IoError,
    OutOfBounds,    // offset + length past the end of the segment
    SpansTerm,      // a single write or read would cross a term boundary
    NonSequential,  // write does not start where the previous one ended
    Sealed,         // segment fully written, no further writes
    NotFound,
    AlreadyExists,
};

const char* store_status_name(StoreStatus s) noexcept;

struct StoreResult {
    StoreStatus status{StoreStatus::Ok};
    int error_code{0};

    bool ok() const noexcept { return status == StoreStatus::Ok; }
};

struct SegmentGeometry {
    std::int32_t segment_file_length{0};
    std::int32_t term_buffer_length{0};
};

// Exclusively owned by one session for its lifetime.
class SegmentHandle {
public:
    std::int64_t recording_id() const noexcept { return recording_id_; }
    std::int64_t segment_index() const noexcept { return segment_index_; }
    std::int64_t base_position() const noexcept {
        return segment_index_ * static_cast<std::int64_t>(geometry_.segment_file_length);
    }
    const SegmentGeometry& geometry() const noexcept { return geometry_; }
    // Offset the next write must start at; -1 until the first write.
    std::int64_t write_cursor() const noexcept { return write_cursor_; }
    bool sealed() const noexcept { return sealed_; }
    bool writable() const noexcept { return writable_; }

private:
    friend class SegmentStore;

    std::unique_ptr<IRandomAccessFile> file_;
    std::int64_t recording_id_{0};
    std::int64_t segment_index_{0};
    SegmentGeometry geometry_{};
    std::int64_t write_cursor_{-1};
    std::uint64_t unsynced_bytes_{0};
    bool writable_{false};
    bool sealed_{false};
};

// Append-only, term-aligned segment files, one set per recording:
//   <archive_dir>/<recordingId>-<segmentIndex>.rec
// Segment i of a recording holds positions [i * segmentFileLength, (i + 1) * segmentFileLength).
// Files are pre-sized to segmentFileLength and never reopened for write.
class SegmentStore {
public:
    SegmentStore(std::filesystem::path archive_dir,
                 SegmentSyncPolicy sync_policy,
                 FileFactory file_factory = default_file_factory());

    StoreResult open(std::int64_t recording_id,
                     std::int64_t segment_index,
                     const SegmentGeometry& geometry,
                     std::unique_ptr<SegmentHandle>& out);

    StoreResult open_for_read(std::int64_t recording_id,
                              std::int64_t segment_index,
                              const SegmentGeometry& geometry,
                              std::unique_ptr<SegmentHandle>& out);

    // `offset` is relative to the segment start. Must stay within one term and one segment.
    StoreResult write(SegmentHandle& handle, std::int64_t offset, std::span<const std::byte> bytes) noexcept;

    // Fills `out` completely or fails; must stay within one term and one segment.
    StoreResult read(SegmentHandle& handle, std::int64_t offset, std::span<std::byte> out) noexcept;

    StoreResult sync(SegmentHandle& handle) noexcept;

    // Flushes per the sync policy and releases the file.
    StoreResult close(SegmentHandle& handle) noexcept;

    StoreResult delete_recording(std::int64_t recording_id);

    std::vector<std::int64_t> segment_indices(std::int64_t recording_id) const;

    // Position after the last complete frame found on disk for a recording. Used to close
    // recordings left open by a crash.
    StoreResult scan_recorded_position(const archive::RecordingDescriptor& descriptor, std::int64_t& out_position);

    std::filesystem::path segment_path(std::int64_t recording_id, std::int64_t segment_index) const;
    const std::filesystem::path& archive_dir() const noexcept { return archive_dir_; }
    const SegmentSyncPolicy& sync_policy() const noexcept { return sync_policy_; }

    static std::string segment_file_name(std::int64_t recording_id, std::int64_t segment_index);

private:
    StoreResult check_bounds(const SegmentHandle& handle, std::int64_t offset, std::size_t length) const noexcept;

    std::filesystem::path archive_dir_;
    SegmentSyncPolicy sync_policy_;
    FileFactory file_factory_;
};

} // namespace persist
