#pragma once

#include <filesystem>
#include <optional>
#include <expected>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace ztgate {

struct FileWriteError {
    std::string message;
    int code;
};

enum class LockMode {
    Shared,
    Exclusive
};

// flock(2) on an open descriptor, released on destruction. Locks from
// separate open() calls exclude each other, in one process or many.
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    static std::expected<FileLock, FileWriteError> acquire(int fd, LockMode mode);

    void release();

private:
    explicit FileLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

// Append-only JSONL file. Each append is written in full and flushed to disk
// with fdatasync before it returns, so an acknowledged audit record survives
// a crash. A failed append leaves the file as it was.
class AuditLogFile {
public:
    explicit AuditLogFile(std::filesystem::path path);
    ~AuditLogFile();

    AuditLogFile(const AuditLogFile&) = delete;
    AuditLogFile& operator=(const AuditLogFile&) = delete;

    AuditLogFile(AuditLogFile&&) noexcept;
    AuditLogFile& operator=(AuditLogFile&&) noexcept;

    std::expected<void, FileWriteError> open();
    std::expected<void, FileWriteError> append_line(std::string_view line);
    std::expected<void, FileWriteError> sync();
    void close();

    std::expected<FileLock, FileWriteError> lock(LockMode mode) const;

    // Newest line without its newline; nullopt for an empty file or a device.
    std::expected<std::optional<std::string>, FileWriteError> last_line() const;

    bool is_open() const { return fd_ != -1; }
    const std::filesystem::path& path() const { return path_; }

    // Whole file contents under a shared lock; an absent file reads as empty.
    static std::expected<std::string, FileWriteError> read_all(const std::filesystem::path& path);

private:
    int fd_ = -1;
    std::filesystem::path path_;

    std::expected<void, FileWriteError> write_all(const char* data, size_t size);
    std::expected<void, FileWriteError> roll_back(off_t size, const FileWriteError& cause);
};

} // namespace ztgate
