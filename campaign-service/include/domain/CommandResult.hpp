#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace campaign::domain {

/**
 * @brief Коды ошибок командной стороны
 */
namespace ErrorCode {
    inline const std::string CAMPAIGN_NOT_FOUND = "CAMPAIGN_NOT_FOUND";
    inline const std::string INVALID_STATE = "INVALID_STATE";
    inline const std::string VALIDATION_ERROR = "VALIDATION_ERROR";
    inline const std::string CONCURRENCY_CONFLICT = "CONCURRENCY_CONFLICT";
    inline const std::string STORE_UNAVAILABLE = "STORE_UNAVAILABLE";
    inline const std::string INTERNAL_ERROR = "INTERNAL_ERROR";
}

/**
 * @brief Результат выполнения команды над кампанией
 *
 * При успехе data содержит {id, version, name, status, updatedAt}.
 */
struct CommandResult {
    bool success = false;
    nlohmann::json data;        ///< Снимок кампании после команды
    std::string error;          ///< Сообщение об ошибке
    std::string errorCode;      ///< Один из ErrorCode

    static CommandResult ok(nlohmann::json data) {
        CommandResult result;
        result.success = true;
        result.data = std::move(data);
        return result;
    }

    static CommandResult failure(const std::string& code, const std::string& message) {
        CommandResult result;
        result.errorCode = code;
        result.error = message;
        return result;
    }
};

} // namespace campaign::domain
