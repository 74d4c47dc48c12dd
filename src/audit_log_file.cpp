#include "audit_log_file.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace ztgate {

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::expected<FileLock, FileWriteError> FileLock::acquire(int fd, LockMode mode) {
    int op = mode == LockMode::Exclusive ? LOCK_EX : LOCK_SH;
    while (::flock(fd, op) == -1) {
        if (errno == EINTR) continue;
        int err = errno;
        return std::unexpected(FileWriteError{fmt::format("flock failed: {}", strerror(err)), err});
    }
    return FileLock(fd);
}

void FileLock::release() {
    if (fd_ != -1) {
        ::flock(fd_, LOCK_UN);
        fd_ = -1;
    }
}

AuditLogFile::AuditLogFile(std::filesystem::path path)
    : path_(std::move(path)) {}

AuditLogFile::~AuditLogFile() {
    close();
}

AuditLogFile::AuditLogFile(AuditLogFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

AuditLogFile& AuditLogFile::operator=(AuditLogFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<void, FileWriteError> AuditLogFile::open() {
    if (fd_ != -1) return {};

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(FileWriteError{
                fmt::format("cannot create {}: {}", path_.parent_path().string(), ec.message()), ec.value()});
        }
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ == -1) {
        int err = errno;
        return std::unexpected(
            FileWriteError{fmt::format("Error opening file {}: {}", path_.string(), strerror(err)), err});
    }
    return {};
}

void AuditLogFile::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::expected<void, FileWriteError> AuditLogFile::write_all(const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd_, data, size);
        if (written == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            return std::unexpected(FileWriteError{fmt::format("write failed: {}", strerror(err)), err});
        }
        if (written == 0) {
            return std::unexpected(FileWriteError{"Incomplete write", -1});
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return {};
}

std::expected<void, FileWriteError> AuditLogFile::append_line(std::string_view line) {
    if (fd_ == -1) {
        return std::unexpected(FileWriteError{"File not open", -1});
    }
    std::string buf;
    buf.reserve(line.size() + 1);
    buf.append(line);
    buf += '\n';
    // A short write or failed sync is cut back to this size, so the next
    // record never lands on a partial line.
    off_t before = ::lseek(fd_, 0, SEEK_END);
    if (auto r = write_all(buf.data(), buf.size()); !r) {
        return before == -1 ? r : roll_back(before, r.error());
    }
    if (auto r = sync(); !r) {
        return before == -1 ? r : roll_back(before, r.error());
    }
    return {};
}

std::expected<void, FileWriteError> AuditLogFile::roll_back(off_t size, const FileWriteError& cause) {
    struct stat st{};
    if (::fstat(fd_, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > size) {
        if (::ftruncate(fd_, size) == -1) {
            int err = errno;
            return std::unexpected(FileWriteError{
                fmt::format("{}; partial record left in place: {}", cause.message, strerror(err)), cause.code});
        }
    }
    return std::unexpected(cause);
}

std::expected<FileLock, FileWriteError> AuditLogFile::lock(LockMode mode) const {
    if (fd_ == -1) {
        return std::unexpected(FileWriteError{"File not open", -1});
    }
    return FileLock::acquire(fd_, mode);
}

std::expected<std::optional<std::string>, FileWriteError> AuditLogFile::last_line() const {
    if (fd_ == -1) {
        return std::unexpected(FileWriteError{"File not open", -1});
    }
    struct stat st{};
    if (::fstat(fd_, &st) == -1) {
        int err = errno;
        return std::unexpected(FileWriteError{fmt::format("fstat failed: {}", strerror(err)), err});
    }
    if (!S_ISREG(st.st_mode) || st.st_size == 0) return std::nullopt;

    std::string tail;
    char buf[4096];
    off_t pos = st.st_size;
    while (pos > 0) {
        size_t want = static_cast<size_t>(std::min<off_t>(pos, static_cast<off_t>(sizeof(buf))));
        ssize_t n = ::pread(fd_, buf, want, pos - static_cast<off_t>(want));
        if (n == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            return std::unexpected(FileWriteError{fmt::format("read failed: {}", strerror(err)), err});
        }
        if (static_cast<size_t>(n) != want) {
            return std::unexpected(FileWriteError{"file shrank while reading its tail", -1});
        }
        pos -= static_cast<off_t>(want);
        tail.insert(0, buf, want);

        std::string_view body(tail);
        if (body.ends_with('\n')) body.remove_suffix(1);
        if (size_t nl = body.rfind('\n'); nl != std::string_view::npos) {
            return std::string(body.substr(nl + 1));
        }
    }
    std::string_view body(tail);
    if (body.ends_with('\n')) body.remove_suffix(1);
    return std::string(body);
}

std::expected<void, FileWriteError> AuditLogFile::sync() {
    if (fd_ == -1) return {};
    if (fdatasync(fd_) == -1) {
        int err = errno;
        // Character devices and pipes cannot be synced; the write itself already succeeded.
        if (err == EINVAL || err == EROFS) return {};
        return std::unexpected(FileWriteError{fmt::format("sync failed: {}", strerror(err)), err});
    }
    return {};
}

std::expected<std::string, FileWriteError> AuditLogFile::read_all(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == -1) {
        if (errno == ENOENT) return std::string{};
        int err = errno;
        return std::unexpected(FileWriteError{fmt::format("stat {} failed: {}", path.string(), strerror(err)), err});
    }
    // Devices such as /dev/full are writable sinks with nothing to replay.
    if (!S_ISREG(st.st_mode)) return std::string{};

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        int err = errno;
        return std::unexpected(FileWriteError{fmt::format("Error opening file {}: {}", path.string(), strerror(err)), err});
    }
    auto shared = FileLock::acquire(fd, LockMode::Shared);
    if (!shared) {
        ::close(fd);
        return std::unexpected(shared.error());
    }
    std::string out;
    out.reserve(static_cast<size_t>(st.st_size));
    char buf[65536];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            shared->release();
            ::close(fd);
            return std::unexpected(FileWriteError{fmt::format("read failed: {}", strerror(err)), err});
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    shared->release();
    ::close(fd);
    return out;
}

} // namespace ztgate
