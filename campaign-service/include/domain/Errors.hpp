#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file Errors.hpp
 * @brief Иерархия исключений ядра event sourcing
 */

namespace campaign::domain {

/**
 * @brief Базовое исключение ядра
 */
class EventSourcingException : public std::runtime_error {
public:
    explicit EventSourcingException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Версия потока не совпала с ожидаемой при append
 *
 * Восстанавливается вызывающим: перечитать агрегат, повторить изменение, сохранить снова.
 */
class ConcurrencyConflictException : public EventSourcingException {
public:
    ConcurrencyConflictException(const std::string& streamId, int64_t expectedVersion, int64_t actualVersion)
        : EventSourcingException("Concurrency conflict on stream '" + streamId + "': expected version " +
                                 std::to_string(expectedVersion) + ", actual " + std::to_string(actualVersion))
        , streamId_(streamId)
        , expectedVersion_(expectedVersion)
        , actualVersion_(actualVersion) {}

    const std::string& streamId() const { return streamId_; }
    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }

private:
    std::string streamId_;
    int64_t expectedVersion_;
    int64_t actualVersion_;
};

class AggregateNotFoundException : public EventSourcingException {
public:
    explicit AggregateNotFoundException(const std::string& aggregateId)
        : EventSourcingException("Aggregate not found: " + aggregateId)
        , aggregateId_(aggregateId) {}

    const std::string& aggregateId() const { return aggregateId_; }

private:
    std::string aggregateId_;
};

/**
 * @brief Временная недоступность хранилища (в том числе таймаут операции)
 *
 * После таймаута append результат неизвестен: перед повтором нужно
 * перепроверить текущую версию потока.
 */
class StoreUnavailableException : public EventSourcingException {
public:
    explicit StoreUnavailableException(const std::string& message, bool timeout = false)
        : EventSourcingException(message), timeout_(timeout) {}

    bool isTimeout() const { return timeout_; }

private:
    bool timeout_;
};

class SerializationException : public EventSourcingException {
public:
    SerializationException(const std::string& eventType, const std::string& reason)
        : EventSourcingException("Cannot decode event '" + eventType + "': " + reason)
        , eventType_(eventType) {}

    const std::string& eventType() const { return eventType_; }

private:
    std::string eventType_;
};

class ProjectionApplyException : public EventSourcingException {
public:
    explicit ProjectionApplyException(const std::string& message)
        : EventSourcingException(message) {}
};

/// Нарушение правил жизненного цикла кампании (статус не допускает операцию)
class InvalidCampaignStateException : public EventSourcingException {
public:
    explicit InvalidCampaignStateException(const std::string& message)
        : EventSourcingException(message) {}
};

/// Некорректные входные данные команды
class CampaignValidationException : public EventSourcingException {
public:
    explicit CampaignValidationException(const std::string& message)
        : EventSourcingException(message) {}
};

} // namespace campaign::domain
