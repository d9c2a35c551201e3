#pragma once

#include <string>
#include <stdexcept>

namespace campaign::domain {

/**
 * @brief Статус маркетинговой кампании
 */
enum class CampaignStatus {
    DRAFT,      ///< Черновик, можно редактировать
    SCHEDULED,  ///< Запланирована на время
    SENDING,    ///< Идёт рассылка
    PAUSED,     ///< Рассылка приостановлена
    COMPLETED,  ///< Рассылка завершена
    CANCELED,   ///< Отменена
    FAILED      ///< Завершилась ошибкой
};

inline std::string toString(CampaignStatus status) {
    switch (status) {
        case CampaignStatus::DRAFT:     return "DRAFT";
        case CampaignStatus::SCHEDULED: return "SCHEDULED";
        case CampaignStatus::SENDING:   return "SENDING";
        case CampaignStatus::PAUSED:    return "PAUSED";
        case CampaignStatus::COMPLETED: return "COMPLETED";
        case CampaignStatus::CANCELED:  return "CANCELED";
        case CampaignStatus::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline CampaignStatus campaignStatusFromString(const std::string& str) {
    if (str == "DRAFT")     return CampaignStatus::DRAFT;
    if (str == "SCHEDULED") return CampaignStatus::SCHEDULED;
    if (str == "SENDING")   return CampaignStatus::SENDING;
    if (str == "PAUSED")    return CampaignStatus::PAUSED;
    if (str == "COMPLETED") return CampaignStatus::COMPLETED;
    if (str == "CANCELED")  return CampaignStatus::CANCELED;
    if (str == "FAILED")    return CampaignStatus::FAILED;
    throw std::invalid_argument("Unknown CampaignStatus: " + str);
}

/**
 * @brief Финальный статус: кампания больше не меняется
 */
inline bool isTerminal(CampaignStatus status) {
    return status == CampaignStatus::COMPLETED ||
           status == CampaignStatus::CANCELED ||
           status == CampaignStatus::FAILED;
}

/**
 * @brief Можно ли менять содержимое кампании
 */
inline bool isEditable(CampaignStatus status) {
    return status == CampaignStatus::DRAFT || status == CampaignStatus::SCHEDULED;
}

inline bool canBeScheduled(CampaignStatus status) {
    return status == CampaignStatus::DRAFT;
}

inline bool canBeLaunched(CampaignStatus status) {
    return status == CampaignStatus::DRAFT || status == CampaignStatus::SCHEDULED;
}

} // namespace campaign::domain
