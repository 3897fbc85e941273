#include "syncgate/distributed_mutex.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

DistributedMutex::DistributedMutex(std::shared_ptr<LockProvider> provider,
                                   const std::string& name,
                                   int timeout_seconds)
    : provider_(provider), name_(name), timeout_(timeout_seconds < 0 ? 0 : timeout_seconds) {
    if (!provider_) {
        throw std::invalid_argument("Lock provider cannot be null");
    }
    if (name_.empty()) {
        throw std::invalid_argument("Mutex name cannot be empty");
    }
}

DistributedMutex::~DistributedMutex() {
    release();
}

bool DistributedMutex::acquire() {
    if (held_) {
        spdlog::debug("Mutex '{}' already held by this instance", name_);
        return true;
    }

    LockSignal signal = provider_->acquire(name_, timeout_);
    held_ = (signal == LockSignal::Acquired);

    if (!held_) {
        spdlog::debug("Mutex '{}' not acquired ({}, timeout {}s)", name_, to_string(signal), timeout_);
    }
    return held_;
}

void DistributedMutex::release() {
    if (!held_) return;

    held_ = false;
    provider_->release(name_);
}

} // namespace syncgate
