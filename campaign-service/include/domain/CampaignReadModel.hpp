#pragma once

#include "Timestamp.hpp"
#include "enums/CampaignStatus.hpp"
#include "enums/ContentType.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace campaign::domain {

/**
 * @brief Статистика рассылки
 */
struct CampaignStats {
    int64_t recipients = 0;
    int64_t sent = 0;
    int64_t delivered = 0;
    int64_t opened = 0;
    int64_t clicked = 0;
    int64_t bounced = 0;
    int64_t complaints = 0;
    int64_t unsubscribed = 0;

    bool operator==(const CampaignStats& o) const {
        return recipients == o.recipients && sent == o.sent && delivered == o.delivered &&
               opened == o.opened && clicked == o.clicked && bounced == o.bounced &&
               complaints == o.complaints && unsubscribed == o.unsubscribed;
    }
};

/**
 * @brief Денормализованное представление кампании для запросов
 *
 * Принадлежит CampaignProjection; командная сторона его не изменяет.
 * version - версия потока последнего применённого события.
 */
struct CampaignReadModel {
    std::string id;
    std::string name;
    std::string description;
    std::string subject;
    ContentType contentType = ContentType::HTML;
    std::string fromName;
    std::string fromEmail;
    std::optional<std::string> replyToEmail;
    CampaignStatus status = CampaignStatus::DRAFT;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> scheduledAt;
    std::optional<Timestamp> sentAt;
    std::optional<Timestamp> completedAt;
    std::optional<std::string> segmentId;
    std::optional<std::string> templateId;
    nlohmann::json metadata = nlohmann::json::object();
    CampaignStats stats;
    int64_t version = 0;

    bool operator==(const CampaignReadModel& o) const {
        return id == o.id && name == o.name && description == o.description &&
               subject == o.subject && contentType == o.contentType &&
               fromName == o.fromName && fromEmail == o.fromEmail &&
               replyToEmail == o.replyToEmail && status == o.status &&
               createdAt == o.createdAt && updatedAt == o.updatedAt &&
               scheduledAt == o.scheduledAt && sentAt == o.sentAt &&
               completedAt == o.completedAt && segmentId == o.segmentId &&
               templateId == o.templateId && metadata == o.metadata &&
               stats == o.stats && version == o.version;
    }
    bool operator!=(const CampaignReadModel& o) const { return !(*this == o); }

    nlohmann::json toJson() const;
    static CampaignReadModel fromJson(const nlohmann::json& j);
};

enum class SortDirection { ASC, DESC };

/**
 * @brief Фильтр списка кампаний
 */
struct CampaignFilter {
    std::vector<CampaignStatus> statuses;   ///< Пусто - любой статус
    std::string search;                     ///< Подстрока в name/description/subject (без учёта регистра)
    std::optional<Timestamp> createdFrom;
    std::optional<Timestamp> createdTo;
    std::optional<std::string> segmentId;

    bool matches(const CampaignReadModel& model) const;
};

struct Pagination {
    int page = 1;
    int pageSize = 10;
    std::string sortBy = "createdAt";       ///< createdAt | updatedAt | name
    SortDirection sortDirection = SortDirection::DESC;
};

template <typename T>
struct PagedResult {
    std::vector<T> items;
    int64_t total = 0;
    int page = 1;
    int pageSize = 10;
    int64_t totalPages = 0;
};

} // namespace campaign::domain
