#pragma once

#include <string>
#include <map>

namespace spotbot {
namespace network {

class RequestSigner {
public:
    // Hex HMAC-SHA256 of `payload` keyed with the API secret (Binance SIGNED endpoints)
    static std::string sign(const std::string& secret_key, const std::string& payload);

    // Percent-encoded "k1=v1&k2=v2" in key order; this exact string is what gets signed
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    // Client-assigned order id, unique per placement: "sb-<symbol>-<16 hex>"
    static std::string generateClientOrderId(const std::string& symbol);

private:
    static std::string urlEncode(const std::string& value);
    static std::string toHex(const unsigned char* data, size_t len);
};

} // namespace network
} // namespace spotbot
