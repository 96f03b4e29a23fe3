#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace kasa {
namespace discovery {

/**
 * @brief Fixed-size admission gate
 *
 * At most limit() permits are held at once. Permits release on destruction.
 * in_flight() and peak() are exposed so callers can verify the bound.
 */
class ConcurrencyLimiter {
public:
    using Clock = std::chrono::steady_clock;

    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;

        bool valid() const { return limiter_ != nullptr; }
        void release();

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(ConcurrencyLimiter* limiter) : limiter_(limiter) {}

        ConcurrencyLimiter* limiter_ = nullptr;
    };

    // A limit of 0 is treated as 1
    explicit ConcurrencyLimiter(size_t limit);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    Permit acquire();

    // nullopt when no permit frees up before the deadline
    std::optional<Permit> acquire_until(Clock::time_point deadline);

    size_t limit() const { return limit_; }
    size_t in_flight() const;
    size_t peak() const;

private:
    void release_one();

    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_ = 0;
    size_t peak_ = 0;
};

}  // namespace discovery
}  // namespace kasa
