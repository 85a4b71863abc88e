#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>

namespace spotbot {
namespace network {

class BinanceHttpClient : public IHttpClient {
public:
    static constexpr const char* kProductionUrl = "https://api.binance.com";
    static constexpr const char* kTestnetUrl = "https://testnet.binance.vision";

    BinanceHttpClient(const std::string& api_key,
                      const std::string& secret_key,
                      bool sandbox_mode,
                      std::shared_ptr<execution::RateLimiter> rate_limiter = nullptr);

    HttpResponse get(
        const std::string& endpoint,
        const QueryParams& query_params = {},
        bool signed_request = false
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const QueryParams& query_params,
        bool signed_request = true
    ) override;

    HttpResponse del(
        const std::string& endpoint,
        const QueryParams& query_params,
        bool signed_request = true
    ) override;

    const std::string& baseUrl() const { return base_url_; }
    std::shared_ptr<execution::RateLimiter> rateLimiter() const { return rate_limiter_; }

private:
    std::string api_key_;
    std::string secret_key_;
    std::string base_url_;
    long recv_window_ms_ = 5000;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    HttpResponse send(
        const std::string& method,
        const std::string& endpoint,
        const QueryParams& query_params,
        bool signed_request
    );

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data
    );

    std::string rateGroupFor(const std::string& method, const std::string& endpoint) const;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

// Masks keys/signatures in a JSON body or query string before logging.
std::string sanitizeForLog(const std::string& text);

} // namespace network
} // namespace spotbot
