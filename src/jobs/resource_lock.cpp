#include "jobs/resource_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace playrun::jobs {
namespace {

OsError LastOsError(const std::string& context) {
    const int err = errno;
    return OsError(err, std::strerror(err), context);
}

std::string IoErrorMessage(const OsError& ex, const std::string& action, const std::string& path) {
    return "I/O error(" + std::to_string(ex.error_number) + ") while trying to " + action + " [" + path +
           "]: " + ex.strerror_text;
}

}  // namespace

int PosixLockFileOps::Open(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw LastOsError("open " + path);
    }
    return fd;
}

void PosixLockFileOps::Lock(int fd) {
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno != EINTR) {
            throw LastOsError("flock");
        }
    }
}

void PosixLockFileOps::Unlock(int fd) {
    if (::flock(fd, LOCK_UN) != 0) {
        throw LastOsError("flock");
    }
}

void PosixLockFileOps::Close(int fd) {
    if (::close(fd) != 0) {
        throw LastOsError("close");
    }
}

ResourceLock::ResourceLock(std::shared_ptr<LockFileOps> ops, std::string path, int fd)
    : ops_(std::move(ops)), path_(std::move(path)), fd_(fd) {}

ResourceLock::ResourceLock(ResourceLock&& other) noexcept
    : ops_(std::move(other.ops_)), path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

ResourceLock& ResourceLock::operator=(ResourceLock&& other) noexcept {
    if (this != &other) {
        ReleaseQuietly();
        ops_ = std::move(other.ops_);
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

ResourceLock::~ResourceLock() {
    ReleaseQuietly();
}

void ResourceLock::Release() {
    if (fd_ < 0) {
        return;
    }
    const int fd = fd_;
    fd_ = -1;
    try {
        ops_->Unlock(fd);
    } catch (const OsError& ex) {
        utils::LogError("lock", IoErrorMessage(ex, "release lock file", path_));
        try {
            ops_->Close(fd);
        } catch (const OsError& close_ex) {
            utils::LogWarn("lock", IoErrorMessage(close_ex, "close lock file", path_));
        }
        throw;
    }
    ops_->Close(fd);
    utils::LogDebug("lock", "released " + path_);
}

void ResourceLock::ReleaseQuietly() noexcept {
    try {
        Release();
    } catch (const std::exception& ex) {
        utils::LogWarn("lock", std::string("release failed: ") + ex.what());
    }
}

ResourceLockManager::ResourceLockManager()
    : ops_(std::make_shared<PosixLockFileOps>()) {}

ResourceLockManager::ResourceLockManager(std::shared_ptr<LockFileOps> ops)
    : ops_(std::move(ops)) {}

ResourceLock ResourceLockManager::Acquire(const std::string& path) const {
    int fd = -1;
    try {
        fd = ops_->Open(path);
    } catch (const OsError& ex) {
        utils::LogError("lock", IoErrorMessage(ex, "open lock file", path));
        throw;
    }
    try {
        ops_->Lock(fd);
    } catch (const OsError& ex) {
        try {
            ops_->Close(fd);
        } catch (const OsError& close_ex) {
            utils::LogWarn("lock", IoErrorMessage(close_ex, "close lock file", path));
        }
        utils::LogError("lock", IoErrorMessage(ex, "aquire lock on file", path));
        throw;
    }
    utils::LogDebug("lock", "acquired " + path);
    return ResourceLock(ops_, path, fd);
}

}  // namespace playrun::jobs
