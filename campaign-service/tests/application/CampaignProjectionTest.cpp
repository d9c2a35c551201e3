/**
 * @file CampaignProjectionTest.cpp
 * @brief Unit tests for CampaignProjection
 */

#include <gtest/gtest.h>
#include "application/projections/CampaignProjection.hpp"
#include "application/EventSourcedRepository.hpp"
#include "adapters/secondary/InMemoryEventStore.hpp"
#include "adapters/secondary/InMemoryCampaignReadModelRepository.hpp"
#include "domain/Errors.hpp"
#include "../mocks/CampaignFixtures.hpp"

using namespace campaign;
using namespace campaign::application;
using namespace campaign::tests;

class CampaignProjectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryEventStore>(storageSettings());
        codec_ = std::make_shared<CampaignEventCodec>();
        repository_ = std::make_shared<CampaignRepository>(store_, codec_);
        readModels_ = std::make_shared<adapters::secondary::InMemoryCampaignReadModelRepository>();
        projection_ = std::make_shared<CampaignProjection>(readModels_, codec_);
    }

    // Применить к проекции все события журнала начиная с from
    void project(int64_t from = 1) {
        for (const auto& event : store_->readAll(from)) {
            projection_->apply(event);
        }
    }

    std::shared_ptr<adapters::secondary::InMemoryEventStore> store_;
    std::shared_ptr<CampaignEventCodec> codec_;
    std::shared_ptr<CampaignRepository> repository_;
    std::shared_ptr<adapters::secondary::InMemoryCampaignReadModelRepository> readModels_;
    std::shared_ptr<CampaignProjection> projection_;
    domain::CampaignId id_{"campaign-1"};
};

// ============================================
// ТЕСТЫ handles / apply
// ============================================

TEST_F(CampaignProjectionTest, Handles_OnlyKnownTypes) {
    EXPECT_EQ(projection_->name(), "campaign-read-model");
    EXPECT_TRUE(projection_->handles("campaign.created"));
    EXPECT_TRUE(projection_->handles("campaign.failed"));
    EXPECT_FALSE(projection_->handles("order.created"));
}

TEST_F(CampaignProjectionTest, Created_InitialisesModel) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    repository_->save(campaign);

    project();

    auto model = readModels_->get("campaign-1");
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->name, "Spring");
    EXPECT_EQ(model->status, domain::CampaignStatus::DRAFT);
    EXPECT_EQ(model->segmentId, std::optional<std::string>("segment-all"));
    EXPECT_EQ(model->metadata["owner"], "team-a");
    EXPECT_EQ(model->stats, domain::CampaignStats{});
    EXPECT_EQ(model->createdAt, model->updatedAt);
    EXPECT_EQ(model->version, 1);
}

TEST_F(CampaignProjectionTest, Lifecycle_MatchesAggregate) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    campaign.rename("Spring Sale");
    campaign.launch();
    campaign.pause();
    campaign.resume();
    campaign.complete();
    repository_->save(campaign);

    project();

    auto model = readModels_->get("campaign-1");
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->name, "Spring Sale");
    EXPECT_EQ(model->status, domain::CampaignStatus::COMPLETED);
    EXPECT_EQ(model->sentAt, campaign.state().sentAt);
    EXPECT_EQ(model->completedAt, campaign.state().completedAt);
    EXPECT_EQ(model->updatedAt, *campaign.state().updatedAt);
    EXPECT_EQ(model->version, 6);
}

TEST_F(CampaignProjectionTest, Failed_WritesReasonIntoMetadata) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    campaign.fail("SMTP relay rejected");
    repository_->save(campaign);

    project();

    auto model = readModels_->get("campaign-1");
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->status, domain::CampaignStatus::FAILED);
    EXPECT_EQ(model->metadata["failureReason"], "SMTP relay rejected");
    EXPECT_TRUE(model->metadata.contains("failedAt"));
    EXPECT_EQ(model->metadata["owner"], "team-a");
}

TEST_F(CampaignProjectionTest, Apply_IsIdempotent) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    campaign.rename("Spring Sale");
    repository_->save(campaign);

    project();
    auto first = readModels_->get("campaign-1");

    // Повторная доставка (сбой до сохранения чекпоинта)
    project();
    auto second = readModels_->get("campaign-1");

    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
}

TEST_F(CampaignProjectionTest, Apply_StaleEventSkipped) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    repository_->save(campaign);
    campaign.rename("Spring Sale");
    repository_->save(campaign);

    project();

    // Переприменить только CampaignCreated: модель не должна откатиться
    projection_->apply(store_->readAll(1, 1).front());

    auto model = readModels_->get("campaign-1");
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->name, "Spring Sale");
    EXPECT_EQ(model->version, 2);
}

TEST_F(CampaignProjectionTest, Apply_WithoutModel_ThrowsProjectionApplyException) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    repository_->save(campaign);
    campaign.rename("Spring Sale");
    repository_->save(campaign);

    EXPECT_THROW(project(2), domain::ProjectionApplyException);
    EXPECT_FALSE(readModels_->get("campaign-1").has_value());
}

TEST_F(CampaignProjectionTest, Apply_MalformedPayload_ThrowsSerializationException) {
    auto event = rawEvent("campaign.scheduled", {{"scheduledAt", 42}});
    store_->append("campaign-1", 0, {event});

    EXPECT_THROW(project(), domain::SerializationException);
}

TEST_F(CampaignProjectionTest, Reset_ClearsReadModels) {
    auto campaign = domain::Campaign::create(id_, sampleDraft());
    repository_->save(campaign);
    project();
    ASSERT_EQ(readModels_->count(domain::CampaignFilter{}), 1);

    projection_->reset();

    EXPECT_EQ(readModels_->count(domain::CampaignFilter{}), 0);
}
