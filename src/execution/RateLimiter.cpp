#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace spotbot {
namespace execution {

RateLimiter::RateLimiter()
    : total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    // Market data (weight 1-20 each, 6000/min per IP)
    configs_.emplace("market", RateLimitConfig("market", 20));
    // Account snapshot is weight 20; keep it well below the minute budget
    configs_.emplace("account", RateLimitConfig("account", 5));
    // Orders: 50 per 10s per account
    configs_.emplace("order", RateLimitConfig("order", 5));
    configs_.emplace("default", RateLimitConfig("default", 10));

    LOG_DEBUG("RateLimiter initialized with Binance spot limits");
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        auto now = std::chrono::steady_clock::now();
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("Rate limit pause lifted");
        cv_.notify_all();
    }

    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    auto& config = it->second;

    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_second) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    auto& config = it->second;

    while (true) {
        if (is_blocked_) {
            auto wait_start = std::chrono::steady_clock::now();
            auto status = cv_.wait_until(lock, block_end_time_);
            total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - wait_start
            );
            if (status == std::cv_status::timeout &&
                std::chrono::steady_clock::now() >= block_end_time_) {
                is_blocked_ = false;
            }
            continue;
        }

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");

    resetWindowIfNeeded(it->second);

    return std::max(0, it->second.max_per_second - it->second.current_count);
}

void RateLimiter::updateFromUsedWeight(const std::string& used_weight_header) {
    int used = 0;
    try {
        used = std::stoi(used_weight_header);
    } catch (const std::exception&) {
        LOG_WARN("Unparseable X-MBX-USED-WEIGHT-1M header: {}", used_weight_header);
        return;
    }

    // 90% of the minute budget: stop until the next minute boundary
    if (used < kWeightLimitPerMinute * 9 / 10) {
        return;
    }

    auto now_sys = std::chrono::system_clock::now();
    auto since_minute = std::chrono::duration_cast<std::chrono::milliseconds>(
        now_sys.time_since_epoch()) % std::chrono::minutes(1);
    auto remaining = std::chrono::minutes(1) - since_minute;

    LOG_WARN("Request weight {} of {} used, pausing {} ms",
             used, kWeightLimitPerMinute, remaining.count());

    std::unique_lock<std::mutex> lock(mutex_);
    blockUntil(std::chrono::steady_clock::now() + remaining);
}

void RateLimiter::handleRateLimitError(int status_code, int retry_after_seconds) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (status_code == 429) {
        int pause = retry_after_seconds > 0 ? retry_after_seconds : 1;
        LOG_WARN("HTTP 429 Too Many Requests, pausing all requests for {}s", pause);
        forced_waits_++;
        blockUntil(std::chrono::steady_clock::now() + std::chrono::seconds(pause));
    } else if (status_code == 418) {
        int pause = retry_after_seconds > 0 ? retry_after_seconds : 60;
        LOG_ERROR("HTTP 418 IP ban, pausing all requests for {}s", pause);
        forced_waits_++;
        blockUntil(std::chrono::steady_clock::now() + std::chrono::seconds(pause));
    }
}

bool RateLimiter::isBlocked() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return is_blocked_ && std::chrono::steady_clock::now() < block_end_time_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

void RateLimiter::blockUntil(std::chrono::steady_clock::time_point until) {
    // Never shorten an existing ban
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
    cv_.notify_all();
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.window_start
    );

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace spotbot
