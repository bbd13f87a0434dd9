/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "fluentval/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace fluentval {
namespace utils {

namespace {

char upperAscii(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool isLowerOrDigit(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0 ||
           std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), upperAscii);
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result;
    result.reserve(str.size());

    size_t start = 0;
    size_t pos;
    while ((pos = str.find(from, start)) != std::string::npos) {
        result.append(str, start, pos - start);
        result += to;
        start = pos + from.size();
    }
    result.append(str, start, std::string::npos);
    return result;
}

std::string splitPascalCase(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 4);

    for (size_t i = 0; i < str.size(); i++) {
        char c = str[i];
        if (i > 0 && isUpper(c) && result.back() != ' ') {
            char prev = str[i - 1];
            bool nextIsLower = i + 1 < str.size() &&
                               std::islower(static_cast<unsigned char>(str[i + 1])) != 0;
            // "aB" starts a word, and so does the last capital of an acronym ("HTTPServer")
            if (isLowerOrDigit(prev) || (isUpper(prev) && nextIsLower)) {
                result += ' ';
            }
        }
        result += c;
    }

    return result;
}

int compareOrdinal(const std::string& a, const std::string& b) {
    int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

int compareOrdinalIgnoreCase(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; i++) {
        unsigned char ca = static_cast<unsigned char>(upperAscii(a[i]));
        unsigned char cb = static_cast<unsigned char>(upperAscii(b[i]));
        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
    }
    if (a.size() == b.size()) {
        return 0;
    }
    return a.size() < b.size() ? -1 : 1;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && compareOrdinalIgnoreCase(a, b) == 0;
}

} // namespace utils
} // namespace fluentval
