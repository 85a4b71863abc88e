#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace spotbot {

namespace {
std::string trimUpper(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return out;
}
}

TradingPair::TradingPair(std::string base, std::string quote)
    : base_(std::move(base))
    , quote_(std::move(quote)) {}

TradingPair TradingPair::parse(const std::string& text) {
    const std::string normalized = trimUpper(text);
    const auto slash = normalized.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= normalized.size() ||
        normalized.find('/', slash + 1) != std::string::npos) {
        throw std::invalid_argument("malformed trading pair: '" + text + "'");
    }

    const std::string base = normalized.substr(0, slash);
    const std::string quote = normalized.substr(slash + 1);
    auto alnum = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
    };
    if (!alnum(base) || !alnum(quote)) {
        throw std::invalid_argument("malformed trading pair: '" + text + "'");
    }
    return TradingPair(base, quote);
}

} // namespace spotbot
