#include "concurrency_limiter.hpp"

#include <algorithm>

namespace kasa {
namespace discovery {

ConcurrencyLimiter::Permit::~Permit() { release(); }

ConcurrencyLimiter::Permit::Permit(Permit&& other) noexcept : limiter_(other.limiter_) { other.limiter_ = nullptr; }

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        limiter_ = other.limiter_;
        other.limiter_ = nullptr;
    }
    return *this;
}

void ConcurrencyLimiter::Permit::release() {
    if (limiter_ != nullptr) {
        limiter_->release_one();
        limiter_ = nullptr;
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(size_t limit) : limit_(std::max<size_t>(limit, 1)) {}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_flight_ < limit_; });
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return Permit(this);
}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::acquire_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline, [this] { return in_flight_ < limit_; })) {
        return std::nullopt;
    }
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return Permit(this);
}

size_t ConcurrencyLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t ConcurrencyLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void ConcurrencyLimiter::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    cv_.notify_one();
}

}  // namespace discovery
}  // namespace kasa
