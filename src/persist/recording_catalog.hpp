#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "archive/recording_descriptor.hpp"
#include "persist/random_access_file.hpp"

namespace persist {

enum class CatalogStatus {
    Ok = 0,
    IoError,
    BadHeader,      // existing file is not a catalog of this version
    NotOpen,
    UnknownId,      // id was never allocated
    TooLarge,       // descriptor strings do not fit in a record
    AlreadyClosed,  // CLOSED descriptors are never rewritten
};

const char* catalog_status_name(CatalogStatus s) noexcept;

// Durable index of recording descriptors, one fixed-size record per allocated id in
// <archive_dir>/archive.catalog. Single writer (the conductor).
class RecordingCatalog {
public:
    using Predicate = std::function<bool(const archive::RecordingDescriptor&)>;

    static constexpr const char* file_name = "archive.catalog";

    // Ascending-id iteration over readable descriptors, skipping corrupt slots. Holds only
    // the next id, so it stays valid while the catalog grows and can be resumed later.
    class Cursor {
    public:
        Cursor(const RecordingCatalog& catalog, std::int64_t from_id, Predicate predicate);

        bool next(archive::RecordingDescriptor& out);
        std::int64_t next_id() const noexcept { return next_id_; }

    private:
        const RecordingCatalog* catalog_;
        std::int64_t next_id_;
        Predicate predicate_;
    };

    RecordingCatalog(std::filesystem::path archive_dir, bool sync_writes, FileFactory file_factory = default_file_factory());
    ~RecordingCatalog();

    RecordingCatalog(const RecordingCatalog&) = delete;
    RecordingCatalog& operator=(const RecordingCatalog&) = delete;

    // Creates the file or rebuilds the in-memory index from it.
    CatalogStatus open();
    void close() noexcept;
    bool is_open() const noexcept { return file_ && file_->is_open(); }

    // Assigns the next id and persists a PROVISIONAL placeholder for it.
    CatalogStatus allocate(std::int64_t& out_id);

    CatalogStatus put(const archive::RecordingDescriptor& descriptor);

    std::optional<archive::RecordingDescriptor> get(std::int64_t recording_id) const;

    // -1 when nothing was ever allocated.
    std::int64_t highest_assigned_id() const noexcept { return static_cast<std::int64_t>(slots_.size()) - 1; }
    std::int64_t next_recording_id() const noexcept { return static_cast<std::int64_t>(slots_.size()); }
    std::size_t corrupt_slots() const noexcept { return corrupt_slots_; }

    Cursor list(Predicate predicate = {}, std::int64_t from_id = 0) const;

    // Descriptors whose state is not CLOSED, e.g. left open by a crash.
    std::vector<archive::RecordingDescriptor> unfinished() const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct Slot {
        bool valid{false};
        archive::RecordingDescriptor descriptor;
    };

    CatalogStatus write_record(const archive::RecordingDescriptor& descriptor);
    CatalogStatus init_empty_file();
    std::uint64_t record_offset(std::int64_t recording_id) const noexcept;

    std::filesystem::path dir_;
    std::filesystem::path path_;
    bool sync_writes_;
    FileFactory file_factory_;
    std::unique_ptr<IRandomAccessFile> file_;
    std::vector<Slot> slots_;
    std::size_t corrupt_slots_{0};
};

} // namespace persist
