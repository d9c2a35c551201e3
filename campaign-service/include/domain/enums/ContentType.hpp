#pragma once

#include <string>
#include <stdexcept>

namespace campaign::domain {

/**
 * @brief Формат содержимого письма
 */
enum class ContentType {
    HTML,
    TEXT
};

inline std::string toString(ContentType type) {
    return type == ContentType::TEXT ? "text" : "html";
}

inline ContentType contentTypeFromString(const std::string& str) {
    if (str == "html") return ContentType::HTML;
    if (str == "text") return ContentType::TEXT;
    throw std::invalid_argument("Unknown ContentType: " + str);
}

} // namespace campaign::domain
