#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace spotbot {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }
    bool isServerError() const { return status_code >= 500; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    // Header keys are stored lower-cased
    std::string header(const std::string& name) const {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(key);
        return it != headers.end() ? it->second : std::string();
    }
};

using QueryParams = std::map<std::string, std::string>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Signed requests get timestamp/recvWindow/signature appended.
    // Transport failures throw GatewayError; HTTP errors are returned.
    virtual HttpResponse get(
        const std::string& endpoint,
        const QueryParams& query_params = {},
        bool signed_request = false
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const QueryParams& query_params,
        bool signed_request = true
    ) = 0;

    virtual HttpResponse del(
        const std::string& endpoint,
        const QueryParams& query_params,
        bool signed_request = true
    ) = 0;
};

} // namespace network
} // namespace spotbot
