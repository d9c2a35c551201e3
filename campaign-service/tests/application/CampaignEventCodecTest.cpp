/**
 * @file CampaignEventCodecTest.cpp
 * @brief Unit tests for CampaignEventCodec
 */

#include <gtest/gtest.h>
#include "application/events/CampaignEventCodec.hpp"
#include "domain/Errors.hpp"
#include "../mocks/CampaignFixtures.hpp"

using namespace campaign;
using namespace campaign::application;
using namespace campaign::tests;

class CampaignEventCodecTest : public ::testing::Test {
protected:
    domain::StoredEvent stored(const domain::DomainEvent& event) {
        domain::StoredEvent s;
        s.event = event;
        s.streamId = event.aggregateId;
        s.version = 1;
        s.globalSequence = 1;
        return s;
    }

    CampaignEventCodec codec_;
    domain::CampaignId id_{"campaign-1"};
};

TEST_F(CampaignEventCodecTest, RegistersAllCampaignTypes) {
    EXPECT_EQ(codec_.knownTypes().size(), 10u);
    EXPECT_TRUE(codec_.isKnown("campaign.created"));
    EXPECT_TRUE(codec_.isKnown("campaign.sending.started"));
    EXPECT_FALSE(codec_.isKnown("campaign.archived"));
}

TEST_F(CampaignEventCodecTest, Encode_FillsEnvelope) {
    auto at = domain::Timestamp::fromString("2025-03-01T09:00:00.500Z");
    auto encoded = codec_.encode(domain::CampaignRenamed{"Spring Sale", at}, id_);

    EXPECT_EQ(encoded.eventType, "campaign.renamed");
    EXPECT_EQ(encoded.aggregateId, "campaign-1");
    EXPECT_EQ(encoded.eventId.size(), 36u);
    EXPECT_EQ(encoded.payload["name"], "Spring Sale");
    EXPECT_EQ(encoded.metadata["schemaVersion"], CampaignEventCodec::SCHEMA_VERSION);
    EXPECT_EQ(encoded.occurredAt, at);
}

TEST_F(CampaignEventCodecTest, Decode_RestoresTypedEvent) {
    auto at = domain::Timestamp::fromString("2025-03-01T09:00:00.000Z");
    auto encoded = codec_.encode(domain::CampaignCreated{sampleDraft(), at}, id_);

    auto decoded = codec_.decode(stored(encoded));

    ASSERT_TRUE(std::holds_alternative<domain::CampaignCreated>(decoded));
    EXPECT_EQ(std::get<domain::CampaignCreated>(decoded).details, sampleDraft());
    EXPECT_EQ(domain::occurredAtOf(decoded), at);
}

TEST_F(CampaignEventCodecTest, Decode_MalformedPayload_ThrowsSerializationException) {
    auto event = rawEvent("campaign.renamed", {{"title", "missing name"}});
    event.aggregateId = "campaign-1";

    try {
        codec_.decode(stored(event));
        FAIL() << "Expected SerializationException";
    } catch (const domain::SerializationException& e) {
        EXPECT_EQ(e.eventType(), "campaign.renamed");
    }
}

TEST_F(CampaignEventCodecTest, Decode_UnknownType_Fallback) {
    auto event = rawEvent("campaign.archived", {{"by", "ops"}});
    event.aggregateId = "campaign-1";

    auto decoded = codec_.decode(stored(event));

    ASSERT_TRUE(std::holds_alternative<domain::UnknownCampaignEvent>(decoded));
    EXPECT_EQ(domain::eventTypeOf(decoded), "campaign.archived");
}
