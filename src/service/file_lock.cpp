#include <file_editor/service/file_lock.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace file_editor {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

} // anonymous namespace

Result<FileLock, std::string> FileLock::Acquire(
    const std::string& lock_path, std::chrono::milliseconds timeout) {
    using R = Result<FileLock, std::string>;
    if (lock_path.empty()) {
        return R::Err("lock path is required");
    }

    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return R::Err("cannot open lock file " + lock_path + ": " +
                      std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return R::Ok(FileLock(fd, lock_path));
        }
        const int err = errno;
        if (err != EWOULDBLOCK && err != EINTR) {
            ::close(fd);
            return R::Err("error acquiring file lock for " + lock_path + ": " +
                          std::strerror(err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            return R::Err("timeout acquiring lock");
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

std::string FileLock::LockPathFor(const std::string& file_path) {
    const std::filesystem::path p(file_path);
    return (p.parent_path() / ("." + p.filename().string() + ".lock")).string();
}

FileLock::FileLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

FileLock::~FileLock() {
    Release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        Release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::Release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace file_editor
