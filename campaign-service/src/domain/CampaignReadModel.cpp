#include "domain/CampaignReadModel.hpp"
#include <algorithm>
#include <cctype>

namespace campaign::domain {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalTimestamp(const std::optional<Timestamp>& value) {
    return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
}

std::optional<std::string> readOptionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

std::optional<Timestamp> readOptionalTimestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return Timestamp::fromString(j[key].get<std::string>());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return lower(haystack).find(lower(needle)) != std::string::npos;
}

} // namespace

nlohmann::json CampaignReadModel::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;
    j["subject"] = subject;
    j["contentType"] = toString(contentType);
    j["fromName"] = fromName;
    j["fromEmail"] = fromEmail;
    j["replyToEmail"] = optionalString(replyToEmail);
    j["status"] = toString(status);
    j["createdAt"] = createdAt.toString();
    j["updatedAt"] = updatedAt.toString();
    j["scheduledAt"] = optionalTimestamp(scheduledAt);
    j["sentAt"] = optionalTimestamp(sentAt);
    j["completedAt"] = optionalTimestamp(completedAt);
    j["segmentId"] = optionalString(segmentId);
    j["templateId"] = optionalString(templateId);
    j["metadata"] = metadata;
    j["stats"] = {
        {"recipients", stats.recipients},
        {"sent", stats.sent},
        {"delivered", stats.delivered},
        {"opened", stats.opened},
        {"clicked", stats.clicked},
        {"bounced", stats.bounced},
        {"complaints", stats.complaints},
        {"unsubscribed", stats.unsubscribed}
    };
    j["version"] = version;
    return j;
}

CampaignReadModel CampaignReadModel::fromJson(const nlohmann::json& j) {
    CampaignReadModel m;
    m.id = j.at("id").get<std::string>();
    m.name = j.value("name", "");
    m.description = j.value("description", "");
    m.subject = j.value("subject", "");
    m.contentType = contentTypeFromString(j.value("contentType", "html"));
    m.fromName = j.value("fromName", "");
    m.fromEmail = j.value("fromEmail", "");
    m.replyToEmail = readOptionalString(j, "replyToEmail");
    m.status = campaignStatusFromString(j.value("status", "DRAFT"));
    m.createdAt = Timestamp::fromString(j.at("createdAt").get<std::string>());
    m.updatedAt = Timestamp::fromString(j.at("updatedAt").get<std::string>());
    m.scheduledAt = readOptionalTimestamp(j, "scheduledAt");
    m.sentAt = readOptionalTimestamp(j, "sentAt");
    m.completedAt = readOptionalTimestamp(j, "completedAt");
    m.segmentId = readOptionalString(j, "segmentId");
    m.templateId = readOptionalString(j, "templateId");
    m.metadata = j.value("metadata", nlohmann::json::object());

    if (j.contains("stats")) {
        const auto& s = j["stats"];
        m.stats.recipients = s.value("recipients", int64_t{0});
        m.stats.sent = s.value("sent", int64_t{0});
        m.stats.delivered = s.value("delivered", int64_t{0});
        m.stats.opened = s.value("opened", int64_t{0});
        m.stats.clicked = s.value("clicked", int64_t{0});
        m.stats.bounced = s.value("bounced", int64_t{0});
        m.stats.complaints = s.value("complaints", int64_t{0});
        m.stats.unsubscribed = s.value("unsubscribed", int64_t{0});
    }

    m.version = j.value("version", int64_t{0});
    return m;
}

bool CampaignFilter::matches(const CampaignReadModel& model) const {
    if (!statuses.empty() &&
        std::find(statuses.begin(), statuses.end(), model.status) == statuses.end()) {
        return false;
    }

    if (!search.empty() &&
        !containsIgnoreCase(model.name, search) &&
        !containsIgnoreCase(model.description, search) &&
        !containsIgnoreCase(model.subject, search)) {
        return false;
    }

    if (createdFrom && model.createdAt < *createdFrom) return false;
    if (createdTo && model.createdAt > *createdTo) return false;
    if (segmentId && model.segmentId != segmentId) return false;

    return true;
}

} // namespace campaign::domain
