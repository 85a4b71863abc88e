#include "network/RequestSigner.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace spotbot {
namespace network {

std::string RequestSigner::toHex(const unsigned char* data, size_t len) {
    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string RequestSigner::sign(const std::string& secret_key, const std::string& payload) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    const unsigned char* result = HMAC(
        EVP_sha256(),
        secret_key.data(), static_cast<int>(secret_key.size()),
        reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
        signature, &signature_len);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 signing failed");
    }

    return toHex(signature, signature_len);
}

std::string RequestSigner::urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string RequestSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << urlEncode(key) << "=" << urlEncode(value);
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::generateClientOrderId(const std::string& symbol) {
    unsigned char random_bytes[8];
    if (RAND_bytes(random_bytes, sizeof(random_bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating client order id");
    }

    // Binance limit: 36 chars of [.A-Z:/a-z0-9_-]
    std::string tag = symbol.substr(0, 12);
    return "sb-" + tag + "-" + toHex(random_bytes, sizeof(random_bytes));
}

} // namespace network
} // namespace spotbot
