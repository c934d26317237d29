#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace autolab::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string NowIso() {
    const auto time = std::chrono::system_clock::to_time_t(Now());
    std::tm local_time{};
    localtime_r(&time, &local_time);
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline std::string Truncate(const std::string& value, std::size_t max_length) {
    if (value.size() <= max_length) {
        return value;
    }
    if (max_length <= 3) {
        return value.substr(0, max_length);
    }
    return value.substr(0, max_length - 3) + "...";
}

inline std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Jaccard similarity over lower-cased whitespace tokens, in [0, 1].
inline double TextSimilarity(const std::string& lhs, const std::string& rhs) {
    auto tokenize = [](const std::string& text) {
        std::set<std::string> tokens;
        std::istringstream stream(ToLower(text));
        std::string token;
        while (stream >> token) {
            tokens.insert(token);
        }
        return tokens;
    };
    const auto left = tokenize(lhs);
    const auto right = tokenize(rhs);
    if (left.empty() || right.empty()) {
        return 0.0;
    }
    std::size_t shared = 0;
    for (const auto& token : left) {
        if (right.count(token) > 0) {
            ++shared;
        }
    }
    const auto combined = left.size() + right.size() - shared;
    return combined == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(combined);
}

// Lower-case hex SHA-256 digest of `input`.
std::string Sha256Hex(const std::string& input);

}  // namespace autolab::utils
