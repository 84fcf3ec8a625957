#pragma once

#include <memory>
#include <string>

namespace playrun::jobs {

// Syscall seam for the lock file. Every method throws OsError on failure.
class LockFileOps {
public:
    virtual ~LockFileOps() = default;

    virtual int Open(const std::string& path) = 0;
    virtual void Lock(int fd) = 0;
    virtual void Unlock(int fd) = 0;
    virtual void Close(int fd) = 0;
};

class PosixLockFileOps : public LockFileOps {
public:
    int Open(const std::string& path) override;
    void Lock(int fd) override;
    void Unlock(int fd) override;
    void Close(int fd) override;
};

class ResourceLock {
public:
    ResourceLock(std::shared_ptr<LockFileOps> ops, std::string path, int fd);
    ResourceLock(ResourceLock&& other) noexcept;
    ResourceLock& operator=(ResourceLock&& other) noexcept;
    ResourceLock(const ResourceLock&) = delete;
    ResourceLock& operator=(const ResourceLock&) = delete;
    ~ResourceLock();

    bool Held() const { return fd_ >= 0; }
    const std::string& Path() const { return path_; }

    void Release();

private:
    void ReleaseQuietly() noexcept;

    std::shared_ptr<LockFileOps> ops_;
    std::string path_;
    int fd_ = -1;
};

// Exclusive advisory locks on shared paths. Acquire blocks until the lock is free.
class ResourceLockManager {
public:
    ResourceLockManager();
    explicit ResourceLockManager(std::shared_ptr<LockFileOps> ops);

    ResourceLock Acquire(const std::string& path) const;

private:
    std::shared_ptr<LockFileOps> ops_;
};

}  // namespace playrun::jobs
