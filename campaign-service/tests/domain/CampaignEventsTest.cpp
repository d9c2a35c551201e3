/**
 * @file CampaignEventsTest.cpp
 * @brief Payload schema of campaign events
 */

#include <gtest/gtest.h>
#include "domain/events/CampaignEvents.hpp"
#include "../mocks/CampaignFixtures.hpp"

using namespace campaign::domain;
using namespace campaign::tests;

TEST(CampaignEventsTest, EventTypeOf_ReturnsTags) {
    auto at = Timestamp::now();
    EXPECT_EQ(eventTypeOf(CampaignCreated{sampleDraft(), at}), "campaign.created");
    EXPECT_EQ(eventTypeOf(CampaignRenamed{"x", at}), "campaign.renamed");
    EXPECT_EQ(eventTypeOf(CampaignSendingStarted{at, at}), "campaign.sending.started");
    EXPECT_EQ(eventTypeOf(UnknownCampaignEvent{"campaign.archived", {}, at}), "campaign.archived");
}

TEST(CampaignEventsTest, CreatedPayload_UsesCamelCaseAndNulls) {
    auto draft = sampleDraft();
    draft.templateId.reset();

    auto payload = toPayload(CampaignCreated{draft, Timestamp::now()});

    EXPECT_EQ(payload["name"], "Spring");
    EXPECT_EQ(payload["fromEmail"], "news@example.com");
    EXPECT_EQ(payload["contentType"], "html");
    EXPECT_EQ(payload["segmentId"], "segment-all");
    EXPECT_TRUE(payload["templateId"].is_null());
    EXPECT_EQ(payload["metadata"]["owner"], "team-a");
}

TEST(CampaignEventsTest, FromPayload_RestoresCreated) {
    auto at = Timestamp::fromString("2025-03-01T09:00:00.250Z");
    auto payload = toPayload(CampaignCreated{sampleDraft(), at});

    auto event = fromPayload("campaign.created", payload, at);

    ASSERT_TRUE(std::holds_alternative<CampaignCreated>(event));
    EXPECT_EQ(std::get<CampaignCreated>(event).details, sampleDraft());
    EXPECT_EQ(occurredAtOf(event), at);
}

TEST(CampaignEventsTest, FromPayload_Scheduled_ParsesTimestamp) {
    auto at = Timestamp::fromString("2025-03-01T09:00:00Z");
    auto event = fromPayload("campaign.scheduled", {{"scheduledAt", "2025-04-01T12:00:00.000Z"}}, at);

    EXPECT_EQ(std::get<CampaignScheduled>(event).scheduledAt.toString(), "2025-04-01T12:00:00.000Z");
}

TEST(CampaignEventsTest, FromPayload_MissingField_Throws) {
    auto at = Timestamp::now();
    EXPECT_THROW(fromPayload("campaign.renamed", nlohmann::json::object(), at), nlohmann::json::exception);
    EXPECT_THROW(fromPayload("campaign.renamed", nlohmann::json::array(), at), std::invalid_argument);
    EXPECT_THROW(fromPayload("campaign.scheduled", {{"scheduledAt", "soon"}}, at), std::invalid_argument);
}

TEST(CampaignEventsTest, FromPayload_UnknownType_Preserved) {
    nlohmann::json payload = {{"archivedBy", "ops"}};
    auto event = fromPayload("campaign.archived", payload, Timestamp::now());

    ASSERT_TRUE(std::holds_alternative<UnknownCampaignEvent>(event));
    EXPECT_EQ(std::get<UnknownCampaignEvent>(event).payload, payload);
    EXPECT_EQ(toPayload(event), payload);
}
