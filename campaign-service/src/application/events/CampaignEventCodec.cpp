#include "application/events/CampaignEventCodec.hpp"
#include "domain/Errors.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace campaign::application {

CampaignEventCodec::CampaignEventCodec() {
    registerAllEvents();
}

domain::DomainEvent CampaignEventCodec::encode(const domain::CampaignEvent& event,
                                               const domain::CampaignId& aggregateId) const {
    domain::DomainEvent encoded;
    encoded.eventId = utils::UuidGenerator::generate();
    encoded.eventType = domain::eventTypeOf(event);
    encoded.aggregateId = aggregateId.value();
    encoded.payload = domain::toPayload(event);
    encoded.metadata = {{"schemaVersion", SCHEMA_VERSION}};
    encoded.occurredAt = domain::occurredAtOf(event);
    return encoded;
}

domain::CampaignEvent CampaignEventCodec::decode(const domain::StoredEvent& stored) const {
    const auto& type = stored.eventType();
    if (!isKnown(type)) {
        return domain::UnknownCampaignEvent{type, stored.event.payload, stored.event.occurredAt};
    }

    try {
        return domain::fromPayload(type, stored.event.payload, stored.event.occurredAt);
    } catch (const nlohmann::json::exception& e) {
        throw domain::SerializationException(type, e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::SerializationException(type, e.what());
    }
}

bool CampaignEventCodec::isKnown(const std::string& eventType) const {
    return types_.count(eventType) > 0;
}

std::vector<std::string> CampaignEventCodec::knownTypes() const {
    std::vector<std::string> result(types_.begin(), types_.end());
    std::sort(result.begin(), result.end());
    return result;
}

void CampaignEventCodec::registerEvent(const std::string& eventType) {
    types_.insert(eventType);
}

void CampaignEventCodec::registerAllEvents() {
    // ============================================
    // LIFECYCLE
    // ============================================
    registerEvent(domain::CampaignCreated::TYPE);
    registerEvent(domain::CampaignScheduled::TYPE);
    registerEvent(domain::CampaignSendingStarted::TYPE);
    registerEvent(domain::CampaignPaused::TYPE);
    registerEvent(domain::CampaignResumed::TYPE);
    registerEvent(domain::CampaignCanceled::TYPE);
    registerEvent(domain::CampaignCompleted::TYPE);
    registerEvent(domain::CampaignFailed::TYPE);

    // ============================================
    // CONTENT
    // ============================================
    registerEvent(domain::CampaignUpdated::TYPE);
    registerEvent(domain::CampaignRenamed::TYPE);
}

} // namespace campaign::application
