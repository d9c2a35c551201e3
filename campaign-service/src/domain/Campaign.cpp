#include "domain/Campaign.hpp"
#include "domain/Errors.hpp"
#include "utils/Overloaded.hpp"
#include <regex>

namespace campaign::domain {

namespace {

bool isValidEmail(const std::string& email) {
    static const std::regex pattern(R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)");
    return std::regex_match(email, pattern);
}

} // namespace

Campaign Campaign::blank(const CampaignId& id) {
    return Campaign(id);
}

Campaign Campaign::create(const CampaignId& id, const CampaignDraft& draft, const Timestamp& now) {
    validate(draft);

    Campaign campaign(id);
    campaign.raise(CampaignCreated{draft, now});
    return campaign;
}

void Campaign::update(const CampaignDraft& draft, const Timestamp& now) {
    requireCreated();
    requireStatus(isEditable(state_.status), "update");
    validate(draft);

    raise(CampaignUpdated{draft, now});
}

void Campaign::rename(const std::string& name, const Timestamp& now) {
    requireCreated();
    requireStatus(isEditable(state_.status), "rename");
    if (name.empty()) {
        throw CampaignValidationException("Campaign name must not be empty");
    }
    if (name == state_.details.name) {
        return;
    }

    raise(CampaignRenamed{name, now});
}

void Campaign::schedule(const Timestamp& scheduledAt, const Timestamp& now) {
    requireCreated();
    requireStatus(canBeScheduled(state_.status), "schedule");
    if (scheduledAt <= now) {
        throw CampaignValidationException("Scheduled date must be in the future");
    }

    raise(CampaignScheduled{scheduledAt, now});
}

void Campaign::launch(const Timestamp& now) {
    requireCreated();
    requireStatus(canBeLaunched(state_.status), "launch");
    if (!state_.details.segmentId) {
        throw InvalidCampaignStateException("Campaign must have a segment to be sent");
    }

    raise(CampaignSendingStarted{state_.sentAt.value_or(now), now});
}

void Campaign::pause(const Timestamp& now) {
    requireCreated();
    requireStatus(state_.status == CampaignStatus::SENDING, "pause");

    raise(CampaignPaused{now});
}

void Campaign::resume(const Timestamp& now) {
    requireCreated();
    requireStatus(state_.status == CampaignStatus::PAUSED, "resume");

    raise(CampaignResumed{now});
}

void Campaign::cancel(const std::string& reason, const Timestamp& now) {
    requireCreated();
    requireStatus(!isTerminal(state_.status), "cancel");

    raise(CampaignCanceled{reason, now});
}

void Campaign::complete(const Timestamp& now) {
    requireCreated();
    requireStatus(state_.status == CampaignStatus::SENDING, "complete");

    raise(CampaignCompleted{now, now});
}

void Campaign::fail(const std::string& reason, const Timestamp& now) {
    requireCreated();
    requireStatus(!isTerminal(state_.status), "fail");

    raise(CampaignFailed{reason, now});
}

void Campaign::apply(const CampaignEvent& event) {
    std::visit(utils::Overloaded{
        [this](const CampaignCreated& e) {
            state_.created = true;
            state_.details = e.details;
            state_.status = CampaignStatus::DRAFT;
            state_.createdAt = e.occurredAt;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignUpdated& e) {
            nlohmann::json merged = state_.details.metadata;
            merged.update(e.details.metadata);
            state_.details = e.details;
            state_.details.metadata = std::move(merged);
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignRenamed& e) {
            state_.details.name = e.name;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignScheduled& e) {
            state_.status = CampaignStatus::SCHEDULED;
            state_.scheduledAt = e.scheduledAt;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignSendingStarted& e) {
            state_.status = CampaignStatus::SENDING;
            state_.sentAt = e.sentAt;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignPaused& e) {
            state_.status = CampaignStatus::PAUSED;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignResumed& e) {
            state_.status = CampaignStatus::SENDING;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignCanceled& e) {
            state_.status = CampaignStatus::CANCELED;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignCompleted& e) {
            state_.status = CampaignStatus::COMPLETED;
            state_.completedAt = e.completedAt;
            state_.updatedAt = e.occurredAt;
        },
        [this](const CampaignFailed& e) {
            state_.status = CampaignStatus::FAILED;
            state_.details.metadata["failureReason"] = e.reason;
            state_.details.metadata["failedAt"] = e.occurredAt.toString();
            state_.updatedAt = e.occurredAt;
        },
        [](const UnknownCampaignEvent&) {
            // событие из более новой версии схемы - состояние не меняем
        }
    }, event);
}

void Campaign::raise(CampaignEvent event) {
    apply(event);
    recordEvent(base_, std::move(event));
}

void Campaign::requireCreated() const {
    if (!state_.created) {
        throw InvalidCampaignStateException("Campaign " + base_.id.value() + " does not exist");
    }
}

void Campaign::requireStatus(bool allowed, const std::string& operation) const {
    if (!allowed) {
        throw InvalidCampaignStateException(
            "Cannot " + operation + " campaign with status: " + toString(state_.status));
    }
}

void Campaign::validate(const CampaignDraft& draft) {
    if (draft.name.empty()) {
        throw CampaignValidationException("Campaign name must not be empty");
    }
    if (draft.subject.empty()) {
        throw CampaignValidationException("Campaign subject must not be empty");
    }
    if (draft.fromName.empty()) {
        throw CampaignValidationException("Sender name must not be empty");
    }
    if (!isValidEmail(draft.fromEmail)) {
        throw CampaignValidationException("Invalid sender email: " + draft.fromEmail);
    }
    if (draft.replyToEmail && !isValidEmail(*draft.replyToEmail)) {
        throw CampaignValidationException("Invalid reply-to email: " + *draft.replyToEmail);
    }
    if (!draft.metadata.is_object()) {
        throw CampaignValidationException("Campaign metadata must be a JSON object");
    }
}

} // namespace campaign::domain
