#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include <filesystem>
#include <string>

namespace zulu::utils {

/**
 * RAII wrapper around a POSIX file descriptor with positional I/O.
 * Positional reads and writes never move a shared file offset, so a chunk
 * can be read or written by index without touching its neighbours.
 */
class File {
public:
    enum class Mode {
        ReadOnly,
        ReadWrite,       // Open existing file for read/write, create if missing
        ReadWriteTruncate
    };

    File() = default;
    ~File();

    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    static Result<File> open(const std::filesystem::path& path, Mode mode);

    bool is_open() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

    /**
     * Read up to len bytes at offset. Returns the number of bytes read,
     * which is short only at end of file.
     */
    Result<size_t> read_at(uint64_t offset, byte* buffer, size_t len) const;

    /**
     * Write exactly len bytes at offset
     */
    Result<void> write_at(uint64_t offset, const byte* data, size_t len);

    Result<void> truncate(uint64_t size);
    Result<void> sync();
    Result<uint64_t> size() const;

    void close();

private:
    File(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::filesystem::path path_;
};

// Read a whole file into memory
Result<bytes> read_file(const std::filesystem::path& path);

/**
 * Write data to a temporary sibling, fsync it and rename it over path.
 * Readers observe either the old or the new contents, never a mix.
 */
Result<void> atomic_write_file(const std::filesystem::path& path, const bytes& data);
Result<void> atomic_write_file(const std::filesystem::path& path, const std::string& data);

/**
 * Copy from into to and fsync it. A partial destination is removed on failure.
 */
Result<void> copy_file_synced(const std::filesystem::path& from, const std::filesystem::path& to);

/**
 * Move a file into place. Uses rename(2) when source and destination share
 * a filesystem and falls back to copy + fsync + remove otherwise.
 */
Result<void> move_file(const std::filesystem::path& from, const std::filesystem::path& to);

// fsync a directory so that renames inside it are durable
void sync_directory(const std::filesystem::path& dir);

} // namespace zulu::utils
