#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace campaign::domain {

/**
 * @brief Доменное событие в нетипизированном виде (то, что пишется в журнал)
 *
 * Payload - JSON, схема которого определяется eventType.
 * После фиксации в журнале событие не изменяется и не удаляется.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (campaign.created, campaign.renamed, ...)
    std::string aggregateId;    ///< Идентификатор агрегата-источника
    nlohmann::json payload = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp occurredAt;       ///< Время возникновения события в домене
};

/**
 * @brief Событие, зафиксированное в журнале
 *
 * Дополняет DomainEvent метаданными, которые назначает хранилище.
 */
struct StoredEvent {
    DomainEvent event;
    std::string streamId;
    int64_t version = 0;          ///< Позиция в потоке, начиная с 1
    int64_t globalSequence = 0;   ///< Сквозной номер по всем потокам, начиная с 1
    Timestamp recordedAt;

    const std::string& eventType() const { return event.eventType; }
};

} // namespace campaign::domain
