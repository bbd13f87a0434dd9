/**
 * @file comparers.cpp
 * @brief StringComparer implementation
 */

#include "fluentval/validation/comparers.h"
#include "fluentval/utils/string_utils.h"

namespace fluentval::validation {

bool StringComparer::equals(const std::string& a, const std::string& b) const {
    return ignoreCase_ ? utils::equalsIgnoreCase(a, b) : a == b;
}

int StringComparer::compare(const std::string& a, const std::string& b) const {
    return ignoreCase_ ? utils::compareOrdinalIgnoreCase(a, b) : utils::compareOrdinal(a, b);
}

EqualityComparer<std::string> StringComparer::asEqualityComparer() const {
    StringComparer self = *this;
    return [self](const std::string& a, const std::string& b) { return self.equals(a, b); };
}

ThreeWayComparer<std::string> StringComparer::asComparer() const {
    StringComparer self = *this;
    return [self](const std::string& a, const std::string& b) { return self.compare(a, b); };
}

} // namespace fluentval::validation
