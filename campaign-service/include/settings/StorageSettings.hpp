#pragma once

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace campaign::settings {

/**
 * @brief Выбор хранилища и таймаут операций
 *
 * Читает из ENV:
 * - CAMPAIGN_STORAGE_BACKEND: memory | postgres (default: memory)
 * - CAMPAIGN_STORE_TIMEOUT_MS (default: 5000)
 */
class StorageSettings {
public:
    enum class Backend { MEMORY, POSTGRES };

    StorageSettings() {
        if (const char* val = std::getenv("CAMPAIGN_STORAGE_BACKEND")) {
            std::string backend(val);
            if (backend == "postgres") {
                backend_ = Backend::POSTGRES;
            } else if (backend != "memory") {
                throw std::invalid_argument("Unknown CAMPAIGN_STORAGE_BACKEND: " + backend);
            }
        }
        if (const char* val = std::getenv("CAMPAIGN_STORE_TIMEOUT_MS")) {
            operationTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
    }

    Backend getBackend() const { return backend_; }
    std::chrono::milliseconds getOperationTimeout() const { return operationTimeout_; }

    void setOperationTimeout(std::chrono::milliseconds timeout) { operationTimeout_ = timeout; }

private:
    Backend backend_ = Backend::MEMORY;
    std::chrono::milliseconds operationTimeout_{5000};
};

} // namespace campaign::settings
