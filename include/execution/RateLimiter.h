#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace spotbot {
namespace execution {

// Per-group request budget over a rolling one second window
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Shared by every pair worker: Binance limits are per IP / per API key,
// not per symbol.
class RateLimiter {
public:
    // Binance spot REST: 6000 request weight per minute per IP
    static constexpr int kWeightLimitPerMinute = 6000;

    RateLimiter();

    // Non-blocking: false when the group's budget is spent or a ban is active
    bool tryAcquire(const std::string& group);

    // Blocks until the group has budget and no ban is active
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // X-MBX-USED-WEIGHT-1M. Near the limit every group pauses until the
    // minute rolls over.
    void updateFromUsedWeight(const std::string& used_weight_header);

    // 429 / 418. Does not sleep the caller; subsequent acquire() calls wait.
    void handleRateLimitError(int status_code, int retry_after_seconds);

    bool isBlocked() const;

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    void blockUntil(std::chrono::steady_clock::time_point until);
    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace execution
} // namespace spotbot
