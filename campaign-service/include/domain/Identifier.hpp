#pragma once

#include "utils/UuidGenerator.hpp"
#include <string>
#include <functional>
#include <ostream>
#include <stdexcept>

namespace campaign::domain {

/**
 * @brief Строго типизированный идентификатор
 *
 * Tag различает идентификаторы разных агрегатов на уровне типов:
 * CampaignId нельзя случайно передать туда, где ожидается другой Id.
 */
template <typename Tag>
class Identifier {
public:
    explicit Identifier(std::string value) : value_(std::move(value)) {
        if (value_.empty()) {
            throw std::invalid_argument("Identifier must not be empty");
        }
    }

    static Identifier generate() {
        return Identifier(utils::UuidGenerator::generate());
    }

    const std::string& value() const { return value_; }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
    bool operator<(const Identifier& other) const { return value_ < other.value_; }

    struct Hash {
        size_t operator()(const Identifier& id) const { return std::hash<std::string>{}(id.value_); }
    };

private:
    std::string value_;
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const Identifier<Tag>& id) {
    return os << id.value();
}

struct CampaignTag {};
using CampaignId = Identifier<CampaignTag>;

} // namespace campaign::domain
