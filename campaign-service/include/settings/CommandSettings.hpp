#pragma once

#include <cstdlib>
#include <string>

namespace campaign::settings {

/**
 * @brief Настройки командной стороны
 *
 * Читает из ENV:
 * - CAMPAIGN_MAX_CONFLICT_RETRIES (default: 3)
 */
class CommandSettings {
public:
    CommandSettings() {
        if (const char* val = std::getenv("CAMPAIGN_MAX_CONFLICT_RETRIES")) {
            maxConflictRetries_ = std::stoi(val);
        }
    }

    int getMaxConflictRetries() const { return maxConflictRetries_; }
    void setMaxConflictRetries(int retries) { maxConflictRetries_ = retries; }

private:
    int maxConflictRetries_ = 3;
};

} // namespace campaign::settings
