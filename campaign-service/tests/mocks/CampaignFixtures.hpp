#pragma once

#include "domain/CampaignDraft.hpp"
#include "domain/events/DomainEvent.hpp"
#include "settings/StorageSettings.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace campaign::tests {

inline domain::CampaignDraft sampleDraft(const std::string& name = "Spring") {
    domain::CampaignDraft draft;
    draft.name = name;
    draft.description = "Seasonal newsletter";
    draft.subject = "Spring is here";
    draft.content = "<h1>Hello</h1>";
    draft.fromName = "Marketing";
    draft.fromEmail = "news@example.com";
    draft.segmentId = "segment-all";
    draft.metadata = {{"owner", "team-a"}};
    return draft;
}

inline domain::DomainEvent rawEvent(const std::string& type, nlohmann::json payload = nlohmann::json::object()) {
    domain::DomainEvent event;
    event.eventType = type;
    event.payload = std::move(payload);
    return event;
}

inline std::shared_ptr<settings::StorageSettings> storageSettings(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
    auto settings = std::make_shared<settings::StorageSettings>();
    settings->setOperationTimeout(timeout);
    return settings;
}

} // namespace campaign::tests
