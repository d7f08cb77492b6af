#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

enum class OpenMode {
    CreateExclusive,  // new file, fails if it exists
    ReadWrite,        // existing or new file, read/write
    ReadOnly,
};

// Positional file access. Segment files and the catalog are written and read through
// this interface so tests can inject short writes and I/O failures.
class IRandomAccessFile {
public:
    virtual ~IRandomAccessFile() = default;
    virtual IoResult open(const std::string& path, OpenMode mode) noexcept = 0;
    virtual void close() noexcept = 0;
    virtual IoResult pwrite(std::span<const std::byte> data, std::uint64_t offset, std::size_t& written) noexcept = 0;
    virtual IoResult pread(std::span<std::byte> out, std::uint64_t offset, std::size_t& read) noexcept = 0;
    virtual IoResult sync() noexcept = 0;
    virtual IoResult truncate(std::uint64_t size) noexcept = 0;
    virtual IoResult size(std::uint64_t& out) noexcept = 0;
    virtual bool is_open() const noexcept = 0;
};

using FileFactory = std::function<std::unique_ptr<IRandomAccessFile>()>;

class PosixRandomAccessFile final : public IRandomAccessFile {
public:
    PosixRandomAccessFile() = default;
    ~PosixRandomAccessFile() override;

    PosixRandomAccessFile(const PosixRandomAccessFile&) = delete;
    PosixRandomAccessFile& operator=(const PosixRandomAccessFile&) = delete;

    IoResult open(const std::string& path, OpenMode mode) noexcept override;
    void close() noexcept override;
    IoResult pwrite(std::span<const std::byte> data, std::uint64_t offset, std::size_t& written) noexcept override;
    IoResult pread(std::span<std::byte> out, std::uint64_t offset, std::size_t& read) noexcept override;
    IoResult sync() noexcept override;
    IoResult truncate(std::uint64_t size) noexcept override;
    IoResult size(std::uint64_t& out) noexcept override;
    bool is_open() const noexcept override { return fd_ >= 0; }

private:
    int fd_{-1};
};

inline FileFactory default_file_factory() {
    return [] { return std::make_unique<PosixRandomAccessFile>(); };
}

// Writes the whole span, looping over short writes and EINTR. Any other failure is
// returned as-is; the caller decides what a partial write means.
IoResult write_fully(IRandomAccessFile& file, std::span<const std::byte> data, std::uint64_t offset) noexcept;

// Reads until the span is full or end of file; `read` reports the bytes obtained.
IoResult read_fully(IRandomAccessFile& file, std::span<std::byte> out, std::uint64_t offset, std::size_t& read) noexcept;

} // namespace persist
