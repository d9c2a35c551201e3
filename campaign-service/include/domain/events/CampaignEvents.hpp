#pragma once

#include "domain/CampaignDraft.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace campaign::domain {

/**
 * @file CampaignEvents.hpp
 * @brief Типизированные события кампании
 *
 * Закрытый набор: свёртка агрегата и проекция обрабатывают все варианты
 * через std::visit. UnknownCampaignEvent сохраняет событие неизвестного
 * типа (пишет более новая версия сервиса при rolling deploy).
 */

struct CampaignCreated {
    static constexpr const char* TYPE = "campaign.created";
    CampaignDraft details;
    Timestamp occurredAt;
};

struct CampaignUpdated {
    static constexpr const char* TYPE = "campaign.updated";
    CampaignDraft details;
    Timestamp occurredAt;
};

struct CampaignRenamed {
    static constexpr const char* TYPE = "campaign.renamed";
    std::string name;
    Timestamp occurredAt;
};

struct CampaignScheduled {
    static constexpr const char* TYPE = "campaign.scheduled";
    Timestamp scheduledAt;
    Timestamp occurredAt;
};

struct CampaignSendingStarted {
    static constexpr const char* TYPE = "campaign.sending.started";
    Timestamp sentAt;
    Timestamp occurredAt;
};

struct CampaignPaused {
    static constexpr const char* TYPE = "campaign.paused";
    Timestamp occurredAt;
};

struct CampaignResumed {
    static constexpr const char* TYPE = "campaign.resumed";
    Timestamp occurredAt;
};

struct CampaignCanceled {
    static constexpr const char* TYPE = "campaign.canceled";
    std::string reason;
    Timestamp occurredAt;
};

struct CampaignCompleted {
    static constexpr const char* TYPE = "campaign.completed";
    Timestamp completedAt;
    Timestamp occurredAt;
};

struct CampaignFailed {
    static constexpr const char* TYPE = "campaign.failed";
    std::string reason;
    Timestamp occurredAt;
};

struct UnknownCampaignEvent {
    std::string eventType;
    nlohmann::json payload;
    Timestamp occurredAt;
};

using CampaignEvent = std::variant<
    CampaignCreated,
    CampaignUpdated,
    CampaignRenamed,
    CampaignScheduled,
    CampaignSendingStarted,
    CampaignPaused,
    CampaignResumed,
    CampaignCanceled,
    CampaignCompleted,
    CampaignFailed,
    UnknownCampaignEvent>;

/**
 * @brief Тег типа события (для UnknownCampaignEvent - исходный тег)
 */
std::string eventTypeOf(const CampaignEvent& event);

Timestamp occurredAtOf(const CampaignEvent& event);

// Сериализация payload. Время события в payload не входит - оно
// хранится в конверте DomainEvent.
nlohmann::json toPayload(const CampaignEvent& event);

/**
 * @brief Восстановить типизированное событие из payload
 * @throws nlohmann::json::exception / std::invalid_argument при несоответствии схеме
 */
CampaignEvent fromPayload(const std::string& eventType, const nlohmann::json& payload, const Timestamp& occurredAt);

} // namespace campaign::domain
