#pragma once

#include "ports/output/IEventStore.hpp"
#include "settings/StorageSettings.hpp"
#include "domain/Errors.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace campaign::adapters::secondary {

/**
 * @brief In-memory реализация журнала событий
 *
 * Один глобальный лог + индекс позиций по потокам. Все операции под одним
 * timed_mutex: захват ограничен таймаутом операции из StorageSettings.
 * Порядок глобальных номеров совпадает с порядком фиксации.
 */
class InMemoryEventStore : public ports::output::IEventStore {
public:
    explicit InMemoryEventStore(std::shared_ptr<settings::StorageSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[InMemoryEventStore] Created" << std::endl;
    }

    void initialize() override {
        auto lock = acquire("initialize");
        std::cout << "[InMemoryEventStore] Initialized (" << log_.size() << " events)" << std::endl;
    }

    int64_t append(const std::string& streamId,
                   int64_t expectedVersion,
                   const std::vector<domain::DomainEvent>& events) override
    {
        if (expectedVersion < 0) {
            throw std::invalid_argument("expectedVersion must be >= 0");
        }

        auto lock = acquire("append");

        int64_t current = currentVersionLocked(streamId);
        if (current != expectedVersion) {
            throw domain::ConcurrencyConflictException(streamId, expectedVersion, current);
        }

        auto& positions = streams_[streamId];
        int64_t version = current;
        for (const auto& event : events) {
            domain::StoredEvent stored;
            stored.event = event;
            if (stored.event.eventId.empty()) {
                stored.event.eventId = utils::UuidGenerator::generate();
            }
            if (stored.event.aggregateId.empty()) {
                stored.event.aggregateId = streamId;
            }
            stored.streamId = streamId;
            stored.version = ++version;
            stored.globalSequence = static_cast<int64_t>(log_.size()) + 1;
            stored.recordedAt = domain::Timestamp::now();

            positions.push_back(log_.size());
            log_.push_back(std::move(stored));
        }

        return version;
    }

    std::vector<domain::StoredEvent> loadStream(const std::string& streamId,
                                                int64_t fromVersion = 1) override
    {
        auto lock = acquire("loadStream");

        std::vector<domain::StoredEvent> result;
        auto it = streams_.find(streamId);
        if (it == streams_.end()) {
            return result;
        }

        size_t first = fromVersion > 1 ? static_cast<size_t>(fromVersion - 1) : 0;
        for (size_t i = first; i < it->second.size(); ++i) {
            result.push_back(log_[it->second[i]]);
        }
        return result;
    }

    std::vector<domain::StoredEvent> readAll(int64_t fromGlobalSequence,
                                             size_t maxCount = 0) override
    {
        auto lock = acquire("readAll");

        std::vector<domain::StoredEvent> result;
        size_t first = fromGlobalSequence > 1 ? static_cast<size_t>(fromGlobalSequence - 1) : 0;
        for (size_t i = first; i < log_.size(); ++i) {
            if (maxCount > 0 && result.size() >= maxCount) {
                break;
            }
            result.push_back(log_[i]);
        }
        return result;
    }

    int64_t streamVersion(const std::string& streamId) override {
        auto lock = acquire("streamVersion");
        return currentVersionLocked(streamId);
    }

    int64_t lastGlobalSequence() override {
        auto lock = acquire("lastGlobalSequence");
        return static_cast<int64_t>(log_.size());
    }

    void close() override {
        if (!closed_.exchange(true)) {
            std::cout << "[InMemoryEventStore] Closed" << std::endl;
        }
    }

private:
    std::unique_lock<std::timed_mutex> acquire(const char* operation) const {
        if (closed_) {
            throw domain::StoreUnavailableException(std::string("Event store is closed (") + operation + ")");
        }
        std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(settings_->getOperationTimeout())) {
            std::cerr << "[InMemoryEventStore] " << operation << " timed out" << std::endl;
            throw domain::StoreUnavailableException(std::string("Event store ") + operation + " timed out", true);
        }
        return lock;
    }

    int64_t currentVersionLocked(const std::string& streamId) const {
        auto it = streams_.find(streamId);
        return it == streams_.end() ? 0 : static_cast<int64_t>(it->second.size());
    }

    std::shared_ptr<settings::StorageSettings> settings_;
    mutable std::timed_mutex mutex_;
    std::vector<domain::StoredEvent> log_;
    std::unordered_map<std::string, std::vector<size_t>> streams_;
    std::atomic<bool> closed_{false};
};

} // namespace campaign::adapters::secondary
