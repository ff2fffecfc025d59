#pragma once

/**
 * String helpers shared by the CLI, config and exchange layers.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace autotrade {
namespace util {

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

inline std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/**
 * Split a comma-separated string into trimmed, uppercase tokens.
 * Empty tokens are skipped.
 *
 * Example: "btc_usdt, eth_usdt" -> {"BTC_USDT", "ETH_USDT"}
 */
inline std::vector<std::string> split_symbols(const std::string& s) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = to_upper(trim(item));
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

}  // namespace util
}  // namespace autotrade
