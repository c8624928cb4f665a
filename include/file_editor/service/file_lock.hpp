#pragma once

#include <file_editor/core/result.hpp>

#include <chrono>
#include <string>

namespace file_editor {

// ---------------------------------------------------------------------------
// FileLock: exclusive advisory lock (flock) on a sidecar lock file, held
// for the lifetime of the object. Locks conflict across processes and
// across separate FileLock instances inside one process.
// ---------------------------------------------------------------------------
class FileLock {
public:
    // Poll every 10 ms until the lock is free or `timeout` has elapsed.
    // Errors are human-readable ("timeout acquiring lock", open failures).
    static Result<FileLock, std::string> Acquire(
        const std::string& lock_path, std::chrono::milliseconds timeout);

    // Sidecar path used for `file_path`: "<dir>/.<name>.lock".
    static std::string LockPathFor(const std::string& file_path);

    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    FileLock(int fd, std::string path);
    void Release() noexcept;

    int fd_ = -1;
    std::string path_;
};

} // namespace file_editor
