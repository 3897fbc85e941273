#pragma once

#include "syncgate/lock_provider.hpp"
#include <memory>
#include <string>

namespace syncgate {

/**
 * DistributedMutex - named lock owned through a server-side session
 *
 * acquire() waits up to timeout seconds and reports true only for
 * LockSignal::Acquired; anything else leaves the mutex unheld.
 * release() only talks to the provider when this object holds the lock,
 * so calling it twice is harmless.
 *
 * held_ is a local view. The server drops the real lock if the owning
 * session dies, whatever this flag says.
 */
class DistributedMutex {
private:
    std::shared_ptr<LockProvider> provider_;
    std::string name_;
    int timeout_;
    bool held_ = false;

public:
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 5;

    DistributedMutex(std::shared_ptr<LockProvider> provider,
                     const std::string& name,
                     int timeout_seconds = DEFAULT_TIMEOUT_SECONDS);
    ~DistributedMutex();

    DistributedMutex(const DistributedMutex&) = delete;
    DistributedMutex& operator=(const DistributedMutex&) = delete;

    bool acquire();
    void release();

    bool is_held() const { return held_; }
    const std::string& get_name() const { return name_; }
    int get_timeout() const { return timeout_; }
};

// Acquires in the constructor, releases in the destructor
class MutexGuard {
private:
    DistributedMutex& mutex_;
    bool owns_;

public:
    explicit MutexGuard(DistributedMutex& mutex) : mutex_(mutex), owns_(mutex.acquire()) {}
    ~MutexGuard() {
        if (owns_) mutex_.release();
    }

    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;

    bool owns_lock() const { return owns_; }
    explicit operator bool() const { return owns_; }
};

} // namespace syncgate
