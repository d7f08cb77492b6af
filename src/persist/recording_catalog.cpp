#include "persist/recording_catalog.hpp"

#include <array>
#include <cerrno>
#include <system_error>

#include "persist/catalog_format.hpp"
#include "util/log.hpp"

namespace persist {

namespace {
constexpr const char* kComponent = "catalog";
}

const char* catalog_status_name(CatalogStatus s) noexcept {
    switch (s) {
    case CatalogStatus::Ok: return "ok";
    case CatalogStatus::IoError: return "io_error";
    case CatalogStatus::BadHeader: return "bad_header";
    case CatalogStatus::NotOpen: return "not_open";
    case CatalogStatus::UnknownId: return "unknown_id";
    case CatalogStatus::TooLarge: return "too_large";
    case CatalogStatus::AlreadyClosed: return "already_closed";
    }
    return "unknown";
}

RecordingCatalog::Cursor::Cursor(const RecordingCatalog& catalog, std::int64_t from_id, Predicate predicate)
    : catalog_(&catalog), next_id_(from_id < 0 ? 0 : from_id), predicate_(std::move(predicate)) {}

bool RecordingCatalog::Cursor::next(archive::RecordingDescriptor& out) {
    const auto limit = catalog_->next_recording_id();
    while (next_id_ < limit) {
        const auto& slot = catalog_->slots_[static_cast<std::size_t>(next_id_)];
        ++next_id_;
        if (!slot.valid) {
            continue;
        }
        if (!predicate_ || predicate_(slot.descriptor)) {
            out = slot.descriptor;
            return true;
        }
    }
    return false;
}

RecordingCatalog::RecordingCatalog(std::filesystem::path archive_dir, bool sync_writes, FileFactory file_factory)
    : dir_(std::move(archive_dir)),
      path_(dir_ / file_name),
      sync_writes_(sync_writes),
      file_factory_(file_factory ? std::move(file_factory) : default_file_factory()) {}

RecordingCatalog::~RecordingCatalog() { close(); }

void RecordingCatalog::close() noexcept {
    if (file_) {
        file_->close();
        file_.reset();
    }
}

std::uint64_t RecordingCatalog::record_offset(std::int64_t recording_id) const noexcept {
    return catalog_header_length + static_cast<std::uint64_t>(recording_id) * catalog_record_length;
}

CatalogStatus RecordingCatalog::init_empty_file() {
    const IoResult t = file_->truncate(0);
    if (!t.ok) {
        return CatalogStatus::IoError;
    }
    std::array<std::byte, catalog_header_length> header{};
    encode_catalog_header(header);
    const IoResult w = write_fully(*file_, header, 0);
    if (!w.ok) {
        LOG_SLOW_ERROR(kComponent, "failed to write catalog header: errno=%d", w.error_code);
        return CatalogStatus::IoError;
    }
    if (sync_writes_ && !file_->sync().ok) {
        return CatalogStatus::IoError;
    }
    return CatalogStatus::Ok;
}

CatalogStatus RecordingCatalog::open() {
    close();
    slots_.clear();
    corrupt_slots_ = 0;

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        LOG_SLOW_ERROR(kComponent, "cannot create %s: %s", dir_.string().c_str(), ec.message().c_str());
        return CatalogStatus::IoError;
    }

    file_ = file_factory_();
    const IoResult r = file_->open(path_.string(), OpenMode::ReadWrite);
    if (!r.ok) {
        LOG_SLOW_ERROR(kComponent, "cannot open %s: errno=%d", path_.string().c_str(), r.error_code);
        file_.reset();
        return CatalogStatus::IoError;
    }

    std::uint64_t size = 0;
    if (!file_->size(size).ok) {
        close();
        return CatalogStatus::IoError;
    }
    // A header shorter than its fixed length can only be a crash during creation.
    if (size < catalog_header_length) {
        const CatalogStatus s = init_empty_file();
        if (s != CatalogStatus::Ok) {
            close();
        }
        return s;
    }

    std::array<std::byte, catalog_header_length> header_bytes{};
    std::size_t got = 0;
    if (!read_fully(*file_, header_bytes, 0, got).ok || got != header_bytes.size()) {
        close();
        return CatalogStatus::IoError;
    }
    CatalogHeader header{};
    if (!decode_catalog_header(header_bytes, header)) {
        LOG_SLOW_ERROR(kComponent, "%s is not a version %u catalog", path_.string().c_str(),
                       static_cast<unsigned>(catalog_version));
        close();
        return CatalogStatus::BadHeader;
    }

    const std::uint64_t body = size - catalog_header_length;
    const std::uint64_t records = body / catalog_record_length;
    if (body % catalog_record_length != 0) {
        const std::uint64_t keep = catalog_header_length + records * catalog_record_length;
        LOG_SLOW_WARN(kComponent, "truncating torn catalog tail: %llu -> %llu bytes",
                      static_cast<unsigned long long>(size), static_cast<unsigned long long>(keep));
        if (!file_->truncate(keep).ok) {
            close();
            return CatalogStatus::IoError;
        }
    }

    slots_.resize(static_cast<std::size_t>(records));
    std::vector<std::byte> buffer(catalog_record_length);
    for (std::uint64_t id = 0; id < records; ++id) {
        got = 0;
        if (!read_fully(*file_, buffer, record_offset(static_cast<std::int64_t>(id)), got).ok ||
            got != buffer.size()) {
            close();
            return CatalogStatus::IoError;
        }
        Slot& slot = slots_[static_cast<std::size_t>(id)];
        const RecordDecodeStatus s = decode_record(buffer, slot.descriptor);
        slot.valid = s == RecordDecodeStatus::Ok && slot.descriptor.recording_id == static_cast<std::int64_t>(id);
        if (!slot.valid) {
            ++corrupt_slots_;
            LOG_SLOW_WARN(kComponent, "catalog record %llu unreadable, id stays reserved",
                          static_cast<unsigned long long>(id));
        }
    }

    LOG_SLOW_INFO(kComponent, "opened %s: %zu records, %zu corrupt", path_.string().c_str(), slots_.size(),
                  corrupt_slots_);
    return CatalogStatus::Ok;
}

CatalogStatus RecordingCatalog::write_record(const archive::RecordingDescriptor& descriptor) {
    std::array<std::byte, catalog_record_length> buffer{};
    if (!encode_record(descriptor, buffer)) {
        return CatalogStatus::TooLarge;
    }
    const IoResult w = write_fully(*file_, buffer, record_offset(descriptor.recording_id));
    if (!w.ok) {
        LOG_SLOW_ERROR(kComponent, "write of record %lld failed: errno=%d",
                       static_cast<long long>(descriptor.recording_id), w.error_code);
        return CatalogStatus::IoError;
    }
    if (sync_writes_) {
        const IoResult s = file_->sync();
        if (!s.ok) {
            LOG_SLOW_ERROR(kComponent, "sync of record %lld failed: errno=%d",
                           static_cast<long long>(descriptor.recording_id), s.error_code);
            return CatalogStatus::IoError;
        }
    }
    return CatalogStatus::Ok;
}

CatalogStatus RecordingCatalog::allocate(std::int64_t& out_id) {
    out_id = archive::null_value;
    if (!is_open()) {
        return CatalogStatus::NotOpen;
    }
    Slot slot;
    slot.descriptor.recording_id = next_recording_id();
    slot.descriptor.state = archive::RecordingState::Provisional;
    const CatalogStatus s = write_record(slot.descriptor);
    if (s != CatalogStatus::Ok) {
        return s;
    }
    slot.valid = true;
    out_id = slot.descriptor.recording_id;
    slots_.push_back(std::move(slot));
    return CatalogStatus::Ok;
}

CatalogStatus RecordingCatalog::put(const archive::RecordingDescriptor& descriptor) {
    if (!is_open()) {
        return CatalogStatus::NotOpen;
    }
    if (descriptor.recording_id < 0 || descriptor.recording_id >= next_recording_id()) {
        return CatalogStatus::UnknownId;
    }
    Slot& slot = slots_[static_cast<std::size_t>(descriptor.recording_id)];
    if (slot.valid && slot.descriptor.is_closed()) {
        return CatalogStatus::AlreadyClosed;
    }
    const CatalogStatus s = write_record(descriptor);
    if (s != CatalogStatus::Ok) {
        return s;
    }
    slot.valid = true;
    slot.descriptor = descriptor;
    return CatalogStatus::Ok;
}

std::optional<archive::RecordingDescriptor> RecordingCatalog::get(std::int64_t recording_id) const {
    if (recording_id < 0 || recording_id >= next_recording_id()) {
        return std::nullopt;
    }
    const Slot& slot = slots_[static_cast<std::size_t>(recording_id)];
    if (!slot.valid) {
        return std::nullopt;
    }
    return slot.descriptor;
}

RecordingCatalog::Cursor RecordingCatalog::list(Predicate predicate, std::int64_t from_id) const {
    return Cursor(*this, from_id, std::move(predicate));
}

std::vector<archive::RecordingDescriptor> RecordingCatalog::unfinished() const {
    std::vector<archive::RecordingDescriptor> out;
    for (const auto& slot : slots_) {
        if (slot.valid && !slot.descriptor.is_closed()) {
            out.push_back(slot.descriptor);
        }
    }
    return out;
}

} // namespace persist
