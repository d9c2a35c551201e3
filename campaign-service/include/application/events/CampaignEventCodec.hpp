// include/application/events/CampaignEventCodec.hpp
#pragma once

#include "domain/Identifier.hpp"
#include "domain/events/CampaignEvents.hpp"
#include "domain/events/DomainEvent.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace campaign::application {

/**
 * @brief Кодек событий кампании: типизированное событие <-> запись журнала
 *
 * Все известные типы регистрируются в конструкторе.
 * При добавлении нового события - добавить в registerAllEvents().
 */
class CampaignEventCodec {
public:
    static constexpr int SCHEMA_VERSION = 1;

    CampaignEventCodec();

    /**
     * @brief Упаковать событие агрегата в DomainEvent для append
     *
     * Назначает новый eventId, переносит occurredAt, пишет
     * metadata.schemaVersion.
     */
    domain::DomainEvent encode(const domain::CampaignEvent& event,
                               const domain::CampaignId& aggregateId) const;

    /**
     * @brief Восстановить типизированное событие из журнала
     *
     * Неизвестный тип -> UnknownCampaignEvent.
     * @throws domain::SerializationException если payload известного типа не соответствует схеме
     */
    domain::CampaignEvent decode(const domain::StoredEvent& stored) const;

    bool isKnown(const std::string& eventType) const;

    std::vector<std::string> knownTypes() const;

private:
    void registerAllEvents();
    void registerEvent(const std::string& eventType);

    std::unordered_set<std::string> types_;
};

} // namespace campaign::application
