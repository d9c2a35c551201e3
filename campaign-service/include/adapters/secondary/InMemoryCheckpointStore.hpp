#pragma once

#include "ports/output/ICheckpointStore.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>

namespace campaign::adapters::secondary {

/**
 * @brief In-memory реализация хранилища чекпоинтов
 */
class InMemoryCheckpointStore : public ports::output::ICheckpointStore {
public:
    void initialize() override {
        std::cout << "[InMemoryCheckpointStore] Initialized" << std::endl;
    }

    int64_t load(const std::string& projectionName) override {
        return checkpoints_.find(projectionName).value_or(0);
    }

    void save(const std::string& projectionName, int64_t globalSequence) override {
        checkpoints_.insert(projectionName, globalSequence);
    }

    void reset(const std::string& projectionName) override {
        checkpoints_.erase(projectionName);
    }

private:
    ThreadSafeMap<std::string, int64_t> checkpoints_;
};

} // namespace campaign::adapters::secondary
