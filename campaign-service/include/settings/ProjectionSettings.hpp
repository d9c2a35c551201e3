#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace campaign::settings {

/**
 * @brief Параметры менеджера проекций
 *
 * Читает из ENV:
 * - PROJECTION_POLL_INTERVAL_MS (default: 500)
 * - PROJECTION_BATCH_SIZE (default: 256)
 * - PROJECTION_MAX_APPLY_RETRIES (default: 3)
 * - PROJECTION_RETRY_BACKOFF_MS (default: 100)
 * - PROJECTION_RETRY_BACKOFF_MAX_MS (default: 5000)
 */
class ProjectionSettings {
public:
    ProjectionSettings() {
        if (const char* val = std::getenv("PROJECTION_POLL_INTERVAL_MS")) {
            pollInterval_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("PROJECTION_BATCH_SIZE")) {
            batchSize_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PROJECTION_MAX_APPLY_RETRIES")) {
            maxApplyRetries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("PROJECTION_RETRY_BACKOFF_MS")) {
            retryBackoff_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("PROJECTION_RETRY_BACKOFF_MAX_MS")) {
            retryBackoffMax_ = std::chrono::milliseconds(std::stoi(val));
        }
    }

    std::chrono::milliseconds getPollInterval() const { return pollInterval_; }
    size_t getBatchSize() const { return batchSize_; }
    int getMaxApplyRetries() const { return maxApplyRetries_; }
    std::chrono::milliseconds getRetryBackoff() const { return retryBackoff_; }
    std::chrono::milliseconds getRetryBackoffMax() const { return retryBackoffMax_; }

    /**
     * @brief Пауза перед повтором номер attempt (1, 2, ...): экспоненциально, с потолком
     */
    std::chrono::milliseconds backoffFor(int attempt) const {
        auto delay = retryBackoff_;
        for (int i = 1; i < attempt && delay < retryBackoffMax_; ++i) {
            delay *= 2;
        }
        return delay < retryBackoffMax_ ? delay : retryBackoffMax_;
    }

    // Для тестов
    void setPollInterval(std::chrono::milliseconds v) { pollInterval_ = v; }
    void setBatchSize(size_t v) { batchSize_ = v; }
    void setMaxApplyRetries(int v) { maxApplyRetries_ = v; }
    void setRetryBackoff(std::chrono::milliseconds v) { retryBackoff_ = v; }
    void setRetryBackoffMax(std::chrono::milliseconds v) { retryBackoffMax_ = v; }

private:
    std::chrono::milliseconds pollInterval_{500};
    size_t batchSize_ = 256;
    int maxApplyRetries_ = 3;
    std::chrono::milliseconds retryBackoff_{100};
    std::chrono::milliseconds retryBackoffMax_{5000};
};

} // namespace campaign::settings
