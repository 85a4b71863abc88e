#include "network/BinanceHttpClient.h"
#include "network/RequestSigner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <regex>
#include <set>

namespace spotbot {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "apikey", "api_key", "secret", "secretkey", "secret_key",
        "signature", "x-mbx-apikey", "listenkey"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

long long nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::once_flag curl_init_flag;

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
}

std::string sanitizeForLog(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded()) {
        maskSensitiveJson(parsed);
        return parsed.dump();
    }
    static const std::regex kSignature("(signature=)[0-9a-fA-F]+");
    return std::regex_replace(text, kSignature, "$1***");
}

BinanceHttpClient::BinanceHttpClient(const std::string& api_key,
                                     const std::string& secret_key,
                                     bool sandbox_mode,
                                     std::shared_ptr<execution::RateLimiter> rate_limiter)
    : api_key_(api_key)
    , secret_key_(secret_key)
    , base_url_(sandbox_mode ? kTestnetUrl : kProductionUrl)
    , rate_limiter_(rate_limiter ? std::move(rate_limiter)
                                 : std::make_shared<execution::RateLimiter>())
{
    // curl_global_cleanup is never called: other clients may still be alive
    // at static destruction time.
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    LOG_INFO("Binance REST client targeting {}", base_url_);
}

HttpResponse BinanceHttpClient::get(
    const std::string& endpoint,
    const QueryParams& query_params,
    bool signed_request
) {
    return send("GET", endpoint, query_params, signed_request);
}

HttpResponse BinanceHttpClient::post(
    const std::string& endpoint,
    const QueryParams& query_params,
    bool signed_request
) {
    return send("POST", endpoint, query_params, signed_request);
}

HttpResponse BinanceHttpClient::del(
    const std::string& endpoint,
    const QueryParams& query_params,
    bool signed_request
) {
    return send("DELETE", endpoint, query_params, signed_request);
}

std::string BinanceHttpClient::rateGroupFor(const std::string& method,
                                            const std::string& endpoint) const {
    if (method != "GET" && endpoint.find("/api/v3/order") != std::string::npos) return "order";
    if (endpoint.find("/api/v3/account") != std::string::npos) return "account";
    if (endpoint.find("/api/v3/ticker") != std::string::npos ||
        endpoint.find("/api/v3/klines") != std::string::npos ||
        endpoint.find("/api/v3/exchangeInfo") != std::string::npos) return "market";
    return "default";
}

HttpResponse BinanceHttpClient::send(
    const std::string& method,
    const std::string& endpoint,
    const QueryParams& query_params,
    bool signed_request
) {
    rate_limiter_->acquire(rateGroupFor(method, endpoint));

    QueryParams params = query_params;
    if (signed_request) {
        params["timestamp"] = std::to_string(nowEpochMs());
        params["recvWindow"] = std::to_string(recv_window_ms_);
    }

    std::string query = RequestSigner::buildQueryString(params);
    if (signed_request) {
        // Signature goes last and over the exact bytes that are sent
        std::string signature = RequestSigner::sign(secret_key_, query);
        query += (query.empty() ? "" : "&") + std::string("signature=") + signature;
    }

    std::string url = base_url_ + endpoint;
    std::string body;
    if (method == "POST") {
        body = query;
    } else if (!query.empty()) {
        url += "?" + query;
    }

    auto response = performRequest(method, url, body);

    std::string used_weight = response.header("X-MBX-USED-WEIGHT-1M");
    if (!used_weight.empty()) {
        rate_limiter_->updateFromUsedWeight(used_weight);
    }

    if (response.isRateLimited() || response.isBlocked()) {
        int retry_after = 0;
        std::string retry_header = response.header("Retry-After");
        if (!retry_header.empty()) {
            try {
                retry_after = std::stoi(retry_header);
            } catch (const std::exception&) {
                retry_after = 0;
            }
        }
        rate_limiter_->handleRateLimitError(response.status_code, retry_after);
    }

    if (!response.isSuccess()) {
        LOG_DEBUG("{} {} -> HTTP {} {}", method, endpoint, response.status_code,
                  sanitizeForLog(response.body));
    }

    return response;
}

HttpResponse BinanceHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data
) {
    // One easy handle per request so pair workers never serialize on a shared handle
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw GatewayError("Failed to initialize CURL", 0, 0, method != "GET");
    }

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* raw_list = nullptr;
    raw_list = curl_slist_append(raw_list, ("X-MBX-APIKEY: " + api_key_).c_str());
    raw_list = curl_slist_append(raw_list, "Content-Type: application/x-www-form-urlencoded");
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        // A mutating request may have been delivered before the connection dropped
        const bool uncertain = method != "GET";
        throw GatewayError("CURL error: " + std::string(curl_easy_strerror(res)), 0, 0, uncertain);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    return response;
}

size_t BinanceHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BinanceHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace spotbot
