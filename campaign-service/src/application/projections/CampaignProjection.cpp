#include "application/projections/CampaignProjection.hpp"
#include "domain/Errors.hpp"
#include "utils/Overloaded.hpp"
#include <iostream>

namespace campaign::application {

namespace {

void copyDetails(domain::CampaignReadModel& model, const domain::CampaignDraft& details) {
    model.name = details.name;
    model.description = details.description;
    model.subject = details.subject;
    model.contentType = details.contentType;
    model.fromName = details.fromName;
    model.fromEmail = details.fromEmail;
    model.replyToEmail = details.replyToEmail;
    model.segmentId = details.segmentId;
    model.templateId = details.templateId;
}

} // namespace

CampaignProjection::CampaignProjection(
    std::shared_ptr<ports::output::ICampaignReadModelRepository> readModels,
    std::shared_ptr<CampaignEventCodec> codec)
    : readModels_(std::move(readModels))
    , codec_(std::move(codec))
{}

bool CampaignProjection::handles(const std::string& eventType) const {
    return codec_->isKnown(eventType);
}

void CampaignProjection::apply(const domain::StoredEvent& stored) {
    auto event = codec_->decode(stored);

    auto existing = readModels_->get(stored.streamId);
    if (existing && stored.version <= existing->version) {
        std::cout << "[CampaignProjection] Skipping already applied event " << stored.eventType()
                  << " v" << stored.version << " for " << stored.streamId << std::endl;
        return;
    }

    domain::CampaignReadModel model;
    if (std::holds_alternative<domain::CampaignCreated>(event)) {
        model.id = stored.streamId;
    } else if (!existing) {
        throw domain::ProjectionApplyException(
            "Read model for campaign " + stored.streamId + " not found while applying " +
            stored.eventType() + " v" + std::to_string(stored.version));
    } else {
        model = std::move(*existing);
    }

    fold(model, event);
    model.version = stored.version;
    readModels_->save(model);
}

void CampaignProjection::reset() {
    readModels_->clear();
    std::cout << "[CampaignProjection] Read models cleared" << std::endl;
}

void CampaignProjection::fold(domain::CampaignReadModel& model,
                              const domain::CampaignEvent& event) const {
    using namespace domain;

    std::visit(utils::Overloaded{
        [&model](const CampaignCreated& e) {
            copyDetails(model, e.details);
            model.metadata = e.details.metadata;
            model.status = CampaignStatus::DRAFT;
            model.stats = CampaignStats{};
            model.createdAt = e.occurredAt;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignUpdated& e) {
            copyDetails(model, e.details);
            model.metadata.update(e.details.metadata);
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignRenamed& e) {
            model.name = e.name;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignScheduled& e) {
            model.status = CampaignStatus::SCHEDULED;
            model.scheduledAt = e.scheduledAt;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignSendingStarted& e) {
            model.status = CampaignStatus::SENDING;
            model.sentAt = e.sentAt;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignPaused& e) {
            model.status = CampaignStatus::PAUSED;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignResumed& e) {
            model.status = CampaignStatus::SENDING;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignCanceled& e) {
            model.status = CampaignStatus::CANCELED;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignCompleted& e) {
            model.status = CampaignStatus::COMPLETED;
            model.completedAt = e.completedAt;
            model.updatedAt = e.occurredAt;
        },
        [&model](const CampaignFailed& e) {
            model.status = CampaignStatus::FAILED;
            model.metadata["failureReason"] = e.reason;
            model.metadata["failedAt"] = e.occurredAt.toString();
            model.updatedAt = e.occurredAt;
        },
        [](const UnknownCampaignEvent&) {}
    }, event);
}

} // namespace campaign::application
