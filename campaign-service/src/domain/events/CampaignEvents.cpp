#include "domain/events/CampaignEvents.hpp"
#include "utils/Overloaded.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace campaign::domain {

namespace {

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

nlohmann::json draftToJson(const CampaignDraft& d) {
    nlohmann::json j;
    j["name"] = d.name;
    j["description"] = d.description;
    j["subject"] = d.subject;
    j["content"] = d.content;
    j["contentType"] = toString(d.contentType);
    j["fromName"] = d.fromName;
    j["fromEmail"] = d.fromEmail;
    j["replyToEmail"] = optionalToJson(d.replyToEmail);
    j["segmentId"] = optionalToJson(d.segmentId);
    j["templateId"] = optionalToJson(d.templateId);
    j["metadata"] = d.metadata;
    return j;
}

CampaignDraft draftFromJson(const nlohmann::json& j) {
    CampaignDraft d;
    d.name = j.at("name").get<std::string>();
    d.description = j.value("description", "");
    d.subject = j.at("subject").get<std::string>();
    d.content = j.value("content", "");
    d.contentType = contentTypeFromString(j.value("contentType", "html"));
    d.fromName = j.at("fromName").get<std::string>();
    d.fromEmail = j.at("fromEmail").get<std::string>();
    d.replyToEmail = optionalFromJson(j, "replyToEmail");
    d.segmentId = optionalFromJson(j, "segmentId");
    d.templateId = optionalFromJson(j, "templateId");
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        d.metadata = j["metadata"];
        if (!d.metadata.is_object()) {
            throw std::invalid_argument("metadata must be an object");
        }
    }
    return d;
}

Timestamp timestampField(const nlohmann::json& j, const char* key) {
    return Timestamp::fromString(j.at(key).get<std::string>());
}

} // namespace

std::string eventTypeOf(const CampaignEvent& event) {
    return std::visit(utils::Overloaded{
        [](const UnknownCampaignEvent& e) { return e.eventType; },
        [](const auto& e) { return std::string(std::decay_t<decltype(e)>::TYPE); }
    }, event);
}

Timestamp occurredAtOf(const CampaignEvent& event) {
    return std::visit([](const auto& e) { return e.occurredAt; }, event);
}

nlohmann::json toPayload(const CampaignEvent& event) {
    return std::visit(utils::Overloaded{
        [](const CampaignCreated& e) { return draftToJson(e.details); },
        [](const CampaignUpdated& e) { return draftToJson(e.details); },
        [](const CampaignRenamed& e) { return nlohmann::json{{"name", e.name}}; },
        [](const CampaignScheduled& e) {
            return nlohmann::json{{"scheduledAt", e.scheduledAt.toString()}};
        },
        [](const CampaignSendingStarted& e) {
            return nlohmann::json{{"sentAt", e.sentAt.toString()}};
        },
        [](const CampaignPaused&) { return nlohmann::json::object(); },
        [](const CampaignResumed&) { return nlohmann::json::object(); },
        [](const CampaignCanceled& e) { return nlohmann::json{{"reason", e.reason}}; },
        [](const CampaignCompleted& e) {
            return nlohmann::json{{"completedAt", e.completedAt.toString()}};
        },
        [](const CampaignFailed& e) { return nlohmann::json{{"reason", e.reason}}; },
        [](const UnknownCampaignEvent& e) { return e.payload; }
    }, event);
}

CampaignEvent fromPayload(const std::string& eventType, const nlohmann::json& payload, const Timestamp& occurredAt) {
    if (!payload.is_object()) {
        throw std::invalid_argument("payload must be a JSON object");
    }

    if (eventType == CampaignCreated::TYPE) {
        return CampaignCreated{draftFromJson(payload), occurredAt};
    }
    if (eventType == CampaignUpdated::TYPE) {
        return CampaignUpdated{draftFromJson(payload), occurredAt};
    }
    if (eventType == CampaignRenamed::TYPE) {
        return CampaignRenamed{payload.at("name").get<std::string>(), occurredAt};
    }
    if (eventType == CampaignScheduled::TYPE) {
        return CampaignScheduled{timestampField(payload, "scheduledAt"), occurredAt};
    }
    if (eventType == CampaignSendingStarted::TYPE) {
        return CampaignSendingStarted{timestampField(payload, "sentAt"), occurredAt};
    }
    if (eventType == CampaignPaused::TYPE) {
        return CampaignPaused{occurredAt};
    }
    if (eventType == CampaignResumed::TYPE) {
        return CampaignResumed{occurredAt};
    }
    if (eventType == CampaignCanceled::TYPE) {
        return CampaignCanceled{payload.value("reason", ""), occurredAt};
    }
    if (eventType == CampaignCompleted::TYPE) {
        return CampaignCompleted{timestampField(payload, "completedAt"), occurredAt};
    }
    if (eventType == CampaignFailed::TYPE) {
        return CampaignFailed{payload.at("reason").get<std::string>(), occurredAt};
    }
    return UnknownCampaignEvent{eventType, payload, occurredAt};
}

} // namespace campaign::domain
