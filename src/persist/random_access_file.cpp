#include "persist/random_access_file.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

PosixRandomAccessFile::~PosixRandomAccessFile() { close(); }

IoResult PosixRandomAccessFile::open(const std::string& path, OpenMode mode) noexcept {
    close();
    int flags = O_CLOEXEC;
    switch (mode) {
    case OpenMode::CreateExclusive:
        flags |= O_CREAT | O_EXCL | O_RDWR;
        break;
    case OpenMode::ReadWrite:
        flags |= O_CREAT | O_RDWR;
        break;
    case OpenMode::ReadOnly:
        flags |= O_RDONLY;
        break;
    }
    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    fd_ = fd;
    return {true, 0};
}

void PosixRandomAccessFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult PosixRandomAccessFile::pwrite(std::span<const std::byte> data, std::uint64_t offset, std::size_t& written) noexcept {
    written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    const ssize_t ret = ::pwrite(fd_, data.data(), data.size(), static_cast<off_t>(offset));
    if (ret < 0) {
        return {false, errno};
    }
    written = static_cast<std::size_t>(ret);
    return {true, 0};
}

IoResult PosixRandomAccessFile::pread(std::span<std::byte> out, std::uint64_t offset, std::size_t& read) noexcept {
    read = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    const ssize_t ret = ::pread(fd_, out.data(), out.size(), static_cast<off_t>(offset));
    if (ret < 0) {
        return {false, errno};
    }
    read = static_cast<std::size_t>(ret);
    return {true, 0};
}

IoResult PosixRandomAccessFile::sync() noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::fdatasync(fd_) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

IoResult PosixRandomAccessFile::truncate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

IoResult PosixRandomAccessFile::size(std::uint64_t& out) noexcept {
    out = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return {false, errno};
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return {true, 0};
}

IoResult write_fully(IRandomAccessFile& file, std::span<const std::byte> data, std::uint64_t offset) noexcept {
    std::size_t done = 0;
    while (done < data.size()) {
        std::size_t written = 0;
        const IoResult r = file.pwrite(data.subspan(done), offset + done, written);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (written == 0) {
            return {false, EIO};
        }
        done += written;
    }
    return {true, 0};
}

IoResult read_fully(IRandomAccessFile& file, std::span<std::byte> out, std::uint64_t offset, std::size_t& read) noexcept {
    read = 0;
    while (read < out.size()) {
        std::size_t got = 0;
        const IoResult r = file.pread(out.subspan(read), offset + read, got);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (got == 0) {
            break;
        }
        read += got;
    }
    return {true, 0};
}

} // namespace persist
