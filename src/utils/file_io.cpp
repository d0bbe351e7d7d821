#include "file_io.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace zulu::utils {

namespace {

Error io_error(ErrorCode code, const std::string& what, const std::filesystem::path& path) {
    return Error(code, what + ": " + path.string(), std::strerror(errno));
}

} // anonymous namespace

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

Result<File> File::open(const std::filesystem::path& path, Mode mode) {
    int flags = O_CLOEXEC;
    switch (mode) {
        case Mode::ReadOnly:
            flags |= O_RDONLY;
            break;
        case Mode::ReadWrite:
            flags |= O_RDWR | O_CREAT;
            break;
        case Mode::ReadWriteTruncate:
            flags |= O_RDWR | O_CREAT | O_TRUNC;
            break;
    }

    int fd = ::open(path.c_str(), flags, 0600);
    if (fd < 0) {
        ErrorCode code = (errno == ENOENT) ? ErrorCode::StorageNotFound
                                           : ErrorCode::StorageReadFailed;
        return Result<File>::Err(io_error(code, "Failed to open file", path));
    }
    return Result<File>::Ok(File(fd, path));
}

Result<size_t> File::read_at(uint64_t offset, byte* buffer, size_t len) const {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::pread(fd_, buffer + total, len - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<size_t>::Err(io_error(ErrorCode::StorageReadFailed, "pread failed", path_));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    return Result<size_t>::Ok(total);
}

Result<void> File::write_at(uint64_t offset, const byte* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::pwrite(fd_, data + total, len - total,
                             static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(io_error(ErrorCode::StorageWriteFailed, "pwrite failed", path_));
        }
        total += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<void> File::truncate(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return Result<void>::Err(io_error(ErrorCode::StorageWriteFailed, "ftruncate failed", path_));
    }
    return Result<void>::Ok();
}

Result<void> File::sync() {
    if (::fsync(fd_) != 0) {
        return Result<void>::Err(io_error(ErrorCode::StorageWriteFailed, "fsync failed", path_));
    }
    return Result<void>::Ok();
}

Result<uint64_t> File::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        return Result<uint64_t>::Err(io_error(ErrorCode::StorageReadFailed, "fstat failed", path_));
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(st.st_size));
}

void File::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<bytes> read_file(const std::filesystem::path& path) {
    ZULU_TRY_UNWRAP(file, File::open(path, File::Mode::ReadOnly));
    ZULU_TRY_UNWRAP(size, file.size());

    bytes data(static_cast<size_t>(size));
    ZULU_TRY_UNWRAP(read, file.read_at(0, data.data(), data.size()));
    data.resize(read);
    return Result<bytes>::Ok(std::move(data));
}

Result<void> atomic_write_file(const std::filesystem::path& path, const bytes& data) {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        ZULU_TRY_UNWRAP(file, File::open(temp_path, File::Mode::ReadWriteTruncate));
        ZULU_TRY(file.write_at(0, data.data(), data.size()));
        ZULU_TRY(file.sync());
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return Result<void>::Err(ErrorCode::StorageWriteFailed,
                                 "Failed to rename into place: " + path.string());
    }
    sync_directory(path.parent_path());
    return Result<void>::Ok();
}

Result<void> atomic_write_file(const std::filesystem::path& path, const std::string& data) {
    return atomic_write_file(path, bytes(data.begin(), data.end()));
}

Result<void> copy_file_synced(const std::filesystem::path& from, const std::filesystem::path& to) {
    auto copy = [&]() -> Result<void> {
        ZULU_TRY_UNWRAP(src, File::open(from, File::Mode::ReadOnly));
        ZULU_TRY_UNWRAP(dst, File::open(to, File::Mode::ReadWriteTruncate));

        bytes buffer(1024 * 1024);
        uint64_t offset = 0;
        while (true) {
            ZULU_TRY_UNWRAP(n, src.read_at(offset, buffer.data(), buffer.size()));
            if (n == 0) break;
            ZULU_TRY(dst.write_at(offset, buffer.data(), n));
            offset += n;
        }
        return dst.sync();
    };

    auto result = copy();
    if (result.is_err()) {
        std::error_code ec;
        std::filesystem::remove(to, ec);
    }
    return result;
}

Result<void> move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    if (::rename(from.c_str(), to.c_str()) == 0) {
        sync_directory(to.parent_path());
        return Result<void>::Ok();
    }
    if (errno != EXDEV) {
        return Result<void>::Err(io_error(ErrorCode::StorageWriteFailed, "rename failed", to));
    }

    ZULU_LOG_DEBUG("Cross-filesystem move, copying {} to {}", from.string(), to.string());

    // Copy to a sibling of the destination first so the final step is still a rename
    auto staging = to;
    staging += ".moving";
    ZULU_TRY(copy_file_synced(from, staging));

    if (::rename(staging.c_str(), to.c_str()) != 0) {
        std::error_code ec;
        std::filesystem::remove(staging, ec);
        return Result<void>::Err(io_error(ErrorCode::StorageWriteFailed, "rename failed", to));
    }
    sync_directory(to.parent_path());

    std::error_code ec;
    std::filesystem::remove(from, ec);
    if (ec) {
        ZULU_LOG_WARN("Moved {} but failed to remove the source: {}", to.string(), ec.message());
    }
    return Result<void>::Ok();
}

void sync_directory(const std::filesystem::path& dir) {
    auto target = dir.empty() ? std::filesystem::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

} // namespace zulu::utils
