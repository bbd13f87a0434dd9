/**
 * @file message_formatter.cpp
 * @brief MessageFormatter implementation
 */

#include "fluentval/validation/message_formatter.h"

namespace fluentval::validation {

MessageFormatter& MessageFormatter::appendArgument(const std::string& name, const std::string& value) {
    placeholderValues_[name] = value;
    return *this;
}

std::string MessageFormatter::buildMessage(const std::string& messageTemplate) const {
    std::string result;
    result.reserve(messageTemplate.size());

    size_t pos = 0;
    while (pos < messageTemplate.size()) {
        size_t open = messageTemplate.find('{', pos);
        if (open == std::string::npos) {
            result.append(messageTemplate, pos, std::string::npos);
            break;
        }

        size_t close = messageTemplate.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(messageTemplate, pos, std::string::npos);
            break;
        }

        // A nested '{' restarts the scan there: "{{Name}" keeps the first brace
        size_t nested = messageTemplate.find('{', open + 1);
        if (nested != std::string::npos && nested < close) {
            result.append(messageTemplate, pos, nested - pos);
            pos = nested;
            continue;
        }

        result.append(messageTemplate, pos, open - pos);

        std::string key = messageTemplate.substr(open + 1, close - open - 1);
        auto it = placeholderValues_.find(key);
        if (it != placeholderValues_.end()) {
            result += it->second;
        } else {
            result.append(messageTemplate, open, close - open + 1);
        }
        pos = close + 1;
    }

    return result;
}

} // namespace fluentval::validation
