/**
 * @file CampaignCommandServiceTest.cpp
 * @brief Unit tests for CampaignCommandService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/CampaignCommandService.hpp"
#include "adapters/secondary/InMemoryEventStore.hpp"
#include "../mocks/CampaignFixtures.hpp"
#include "../mocks/FlakyEventStore.hpp"
#include "../mocks/MockEventStore.hpp"
#include <stdexcept>

using namespace campaign;
using namespace campaign::application;
using namespace campaign::tests;
namespace ErrorCode = campaign::domain::ErrorCode;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Throw;

class CampaignCommandServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner_ = std::make_shared<adapters::secondary::InMemoryEventStore>(storageSettings());
        store_ = std::make_shared<FlakyEventStore>(inner_);
        codec_ = std::make_shared<CampaignEventCodec>();
        repository_ = std::make_shared<CampaignRepository>(store_, codec_);
        settings_ = std::make_shared<settings::CommandSettings>();
        settings_->setMaxConflictRetries(3);
        service_ = std::make_unique<CampaignCommandService>(repository_, settings_);
    }

    // Записать событие в поток в обход сервиса (конкурирующий писатель)
    void concurrentRename(const std::string& id, const std::string& name) {
        auto other = repository_->get(domain::CampaignId(id));
        other.rename(name);
        inner_->append(id, other.version(), {codec_->encode(domain::pendingEvents(other.base()).front(), other.id())});
    }

    std::shared_ptr<adapters::secondary::InMemoryEventStore> inner_;
    std::shared_ptr<FlakyEventStore> store_;
    std::shared_ptr<CampaignEventCodec> codec_;
    std::shared_ptr<CampaignRepository> repository_;
    std::shared_ptr<settings::CommandSettings> settings_;
    std::unique_ptr<CampaignCommandService> service_;
};

// ============================================
// CREATE
// ============================================

TEST_F(CampaignCommandServiceTest, Create_ReturnsSnapshot) {
    auto result = service_->createCampaign("campaign-1", sampleDraft());

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.data["id"], "campaign-1");
    EXPECT_EQ(result.data["version"], 1);
    EXPECT_EQ(result.data["name"], "Spring");
    EXPECT_EQ(result.data["status"], "DRAFT");
    EXPECT_TRUE(result.data["updatedAt"].is_string());
    EXPECT_TRUE(result.error.empty());
}

TEST_F(CampaignCommandServiceTest, Create_EmptyId_GeneratesOne) {
    auto result = service_->createCampaign("", sampleDraft());

    ASSERT_TRUE(result.success);
    std::string id = result.data["id"];
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(inner_->streamVersion(id), 1);
}

TEST_F(CampaignCommandServiceTest, Create_Duplicate_ValidationError) {
    service_->createCampaign("campaign-1", sampleDraft());

    auto result = service_->createCampaign("campaign-1", sampleDraft("Other"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 1);
}

TEST_F(CampaignCommandServiceTest, Create_InvalidDraft_ValidationError) {
    auto draft = sampleDraft();
    draft.fromEmail = "not-an-email";

    auto result = service_->createCampaign("campaign-1", draft);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(inner_->lastGlobalSequence(), 0);
}

// ============================================
// КОМАНДЫ НАД СУЩЕСТВУЮЩЕЙ КАМПАНИЕЙ
// ============================================

TEST_F(CampaignCommandServiceTest, Rename_AppendsEvent) {
    service_->createCampaign("campaign-1", sampleDraft());

    auto result = service_->renameCampaign("campaign-1", "Spring Sale");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.data["version"], 2);
    EXPECT_EQ(result.data["name"], "Spring Sale");
}

TEST_F(CampaignCommandServiceTest, UnknownCampaign_NotFound) {
    auto result = service_->launchCampaign("missing");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::CAMPAIGN_NOT_FOUND);
}

TEST_F(CampaignCommandServiceTest, EmptyId_ValidationError) {
    EXPECT_EQ(service_->pauseCampaign("").errorCode, ErrorCode::VALIDATION_ERROR);
}

TEST_F(CampaignCommandServiceTest, RuleViolation_InvalidState) {
    service_->createCampaign("campaign-1", sampleDraft());

    auto result = service_->pauseCampaign("campaign-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::INVALID_STATE);
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 1);
}

TEST_F(CampaignCommandServiceTest, Schedule_PastDate_ValidationError) {
    service_->createCampaign("campaign-1", sampleDraft());

    auto result = service_->scheduleCampaign("campaign-1", domain::Timestamp::now().addHours(-1));

    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_ERROR);
}

TEST_F(CampaignCommandServiceTest, FullLifecycle) {
    service_->createCampaign("campaign-1", sampleDraft());

    EXPECT_TRUE(service_->scheduleCampaign("campaign-1", domain::Timestamp::now().addHours(2)).success);
    EXPECT_TRUE(service_->launchCampaign("campaign-1").success);
    EXPECT_TRUE(service_->pauseCampaign("campaign-1").success);
    EXPECT_TRUE(service_->resumeCampaign("campaign-1").success);
    auto result = service_->completeCampaign("campaign-1");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data["status"], "COMPLETED");
    EXPECT_EQ(result.data["version"], 6);

    EXPECT_EQ(service_->cancelCampaign("campaign-1", "too late").errorCode, ErrorCode::INVALID_STATE);
    EXPECT_EQ(service_->failCampaign("campaign-1", "too late").errorCode, ErrorCode::INVALID_STATE);
}

// ============================================
// КОНФЛИКТЫ И НЕДОСТУПНОСТЬ ХРАНИЛИЩА
// ============================================

TEST_F(CampaignCommandServiceTest, Conflict_ReloadsAndReappliesChange) {
    service_->createCampaign("campaign-1", sampleDraft());

    bool raced = false;
    store_->setBeforeAppend([&](const std::string& stream) {
        if (!raced) {
            raced = true;
            concurrentRename(stream, "Spring Promo");
        }
    });

    auto update = sampleDraft("Spring");
    update.metadata = {{"channel", "email"}};
    auto result = service_->updateCampaign("campaign-1", update);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.data["version"], 3);
    EXPECT_EQ(store_->appendCallCount(), 3);   // create + конфликт + повтор

    auto campaign = repository_->get(domain::CampaignId("campaign-1"));
    EXPECT_EQ(campaign.metadata()["owner"], "team-a");
    EXPECT_EQ(campaign.metadata()["channel"], "email");
}

TEST_F(CampaignCommandServiceTest, Conflict_RuleViolationOnFreshStateReported) {
    service_->createCampaign("campaign-1", sampleDraft());
    service_->launchCampaign("campaign-1");

    // Конкурент ставит кампанию на паузу первым
    bool raced = false;
    store_->setBeforeAppend([&](const std::string& stream) {
        if (!raced) {
            raced = true;
            auto other = repository_->get(domain::CampaignId(stream));
            other.pause();
            inner_->append(stream, other.version(),
                           {codec_->encode(domain::pendingEvents(other.base()).front(), other.id())});
        }
    });

    auto result = service_->pauseCampaign("campaign-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::INVALID_STATE);
    EXPECT_THAT(result.error, ::testing::Not(HasSubstr("may have been committed")));
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 3);
}

TEST_F(CampaignCommandServiceTest, Conflict_RetriesExhausted) {
    service_->createCampaign("campaign-1", sampleDraft());
    settings_->setMaxConflictRetries(2);

    int races = 0;
    store_->setBeforeAppend([&](const std::string& stream) {
        concurrentRename(stream, "Racer " + std::to_string(++races));
    });

    auto result = service_->updateCampaign("campaign-1", sampleDraft("Mine"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::CONCURRENCY_CONFLICT);
    EXPECT_EQ(races, 3);
}

TEST_F(CampaignCommandServiceTest, Timeout_NotCommitted_Retried) {
    service_->createCampaign("campaign-1", sampleDraft());
    store_->failAppends(1);

    auto result = service_->renameCampaign("campaign-1", "Spring Sale");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 2);
}

TEST_F(CampaignCommandServiceTest, Timeout_AfterCommit_ReloadSeesOutcome) {
    service_->createCampaign("campaign-1", sampleDraft());
    service_->launchCampaign("campaign-1");
    store_->failAppends(1, true);

    // Пауза дошла до журнала, но вызывающий получил таймаут: повтор на
    // свежем состоянии не дублирует событие, а упирается в правило статуса.
    auto result = service_->pauseCampaign("campaign-1");

    EXPECT_EQ(result.errorCode, ErrorCode::INVALID_STATE);
    EXPECT_THAT(result.error, HasSubstr("may have been committed"));
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 3);
}

TEST_F(CampaignCommandServiceTest, StoreUnavailable_RetriesExhausted) {
    service_->createCampaign("campaign-1", sampleDraft());
    settings_->setMaxConflictRetries(1);
    store_->failAppends(5);

    auto result = service_->renameCampaign("campaign-1", "Spring Sale");

    EXPECT_EQ(result.errorCode, ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(inner_->streamVersion("campaign-1"), 1);
}

TEST_F(CampaignCommandServiceTest, ClosedStore_StoreUnavailable) {
    inner_->close();

    EXPECT_EQ(service_->createCampaign("campaign-1", sampleDraft()).errorCode, ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(service_->renameCampaign("campaign-1", "x").errorCode, ErrorCode::STORE_UNAVAILABLE);
}

TEST_F(CampaignCommandServiceTest, CorruptedStream_InternalError) {
    inner_->append("campaign-1", 0, {rawEvent("campaign.created", {{"unexpected", true}})});

    auto result = service_->renameCampaign("campaign-1", "Spring Sale");

    EXPECT_EQ(result.errorCode, ErrorCode::INTERNAL_ERROR);
}

TEST_F(CampaignCommandServiceTest, RuleViolation_WithoutTimeout_NoCommitHint) {
    service_->createCampaign("campaign-1", sampleDraft());

    auto result = service_->pauseCampaign("campaign-1");

    EXPECT_EQ(result.errorCode, ErrorCode::INVALID_STATE);
    EXPECT_THAT(result.error, ::testing::Not(HasSubstr("may have been committed")));
}

TEST_F(CampaignCommandServiceTest, UnexpectedStoreError_InternalError) {
    auto mockStore = std::make_shared<MockEventStore>();
    EXPECT_CALL(*mockStore, loadStream("campaign-1", _))
        .WillOnce(Throw(std::runtime_error("pqxx: connection reset")));
    EXPECT_CALL(*mockStore, streamVersion("campaign-2"))
        .WillOnce(Throw(std::runtime_error("pqxx: connection reset")));

    auto repository = std::make_shared<CampaignRepository>(mockStore, codec_);
    CampaignCommandService service(repository, settings_);

    auto renamed = service.renameCampaign("campaign-1", "Spring Sale");
    EXPECT_FALSE(renamed.success);
    EXPECT_EQ(renamed.errorCode, ErrorCode::INTERNAL_ERROR);
    EXPECT_THAT(renamed.error, HasSubstr("connection reset"));

    auto created = service.createCampaign("campaign-2", sampleDraft());
    EXPECT_FALSE(created.success);
    EXPECT_EQ(created.errorCode, ErrorCode::INTERNAL_ERROR);
}
