#pragma once

#include "enums/ContentType.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace campaign::domain {

/**
 * @brief Редактируемое содержимое кампании (вход для create/update)
 */
struct CampaignDraft {
    std::string name;
    std::string description;
    std::string subject;
    std::string content;
    ContentType contentType = ContentType::HTML;
    std::string fromName;
    std::string fromEmail;
    std::optional<std::string> replyToEmail;
    std::optional<std::string> segmentId;
    std::optional<std::string> templateId;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const CampaignDraft& other) const {
        return name == other.name && description == other.description &&
               subject == other.subject && content == other.content &&
               contentType == other.contentType && fromName == other.fromName &&
               fromEmail == other.fromEmail && replyToEmail == other.replyToEmail &&
               segmentId == other.segmentId && templateId == other.templateId &&
               metadata == other.metadata;
    }
    bool operator!=(const CampaignDraft& other) const { return !(*this == other); }
};

} // namespace campaign::domain
