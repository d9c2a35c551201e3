/**
 * @file CampaignQueryServiceTest.cpp
 * @brief Unit tests for CampaignQueryService
 */

#include <gtest/gtest.h>
#include "application/CampaignQueryService.hpp"
#include "adapters/secondary/InMemoryCampaignReadModelRepository.hpp"

using namespace campaign;
using namespace campaign::application;

class CampaignQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        readModels_ = std::make_shared<adapters::secondary::InMemoryCampaignReadModelRepository>();
        service_ = std::make_unique<CampaignQueryService>(readModels_);

        auto base = domain::Timestamp::fromString("2025-01-01T00:00:00.000Z");
        for (int i = 1; i <= 25; ++i) {
            domain::CampaignReadModel model;
            model.id = "campaign-" + std::to_string(i);
            model.name = "Campaign " + std::to_string(i);
            model.subject = "Subject";
            model.status = i % 5 == 0 ? domain::CampaignStatus::SENDING : domain::CampaignStatus::DRAFT;
            model.createdAt = base.addHours(i);
            model.updatedAt = model.createdAt;
            model.version = 1;
            readModels_->save(model);
        }
    }

    std::shared_ptr<adapters::secondary::InMemoryCampaignReadModelRepository> readModels_;
    std::unique_ptr<CampaignQueryService> service_;
};

TEST_F(CampaignQueryServiceTest, GetCampaign) {
    auto found = service_->getCampaign("campaign-3");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Campaign 3");

    EXPECT_FALSE(service_->getCampaign("campaign-99").has_value());
    EXPECT_FALSE(service_->getCampaign("").has_value());
}

TEST_F(CampaignQueryServiceTest, List_DefaultsNewestFirst) {
    auto page = service_->listCampaigns({}, {});

    EXPECT_EQ(page.total, 25);
    EXPECT_EQ(page.totalPages, 3);
    EXPECT_EQ(page.page, 1);
    EXPECT_EQ(page.pageSize, 10);
    ASSERT_EQ(page.items.size(), 10u);
    EXPECT_EQ(page.items.front().id, "campaign-25");
}

TEST_F(CampaignQueryServiceTest, List_LastPagePartial) {
    domain::Pagination pagination;
    pagination.page = 3;

    auto page = service_->listCampaigns({}, pagination);

    EXPECT_EQ(page.items.size(), 5u);
    EXPECT_EQ(page.items.back().id, "campaign-1");
}

TEST_F(CampaignQueryServiceTest, List_NormalizesPagination) {
    domain::Pagination pagination;
    pagination.page = -4;
    pagination.pageSize = 0;
    pagination.sortBy = "status; DROP TABLE";

    auto page = service_->listCampaigns({}, pagination);
    EXPECT_EQ(page.page, 1);
    EXPECT_EQ(page.pageSize, 10);
    EXPECT_EQ(page.items.front().id, "campaign-25");

    pagination.pageSize = 1000;
    page = service_->listCampaigns({}, pagination);
    EXPECT_EQ(page.pageSize, CampaignQueryService::MAX_PAGE_SIZE);
    EXPECT_EQ(page.items.size(), 25u);
    EXPECT_EQ(page.totalPages, 1);
}

TEST_F(CampaignQueryServiceTest, List_FilterByStatus) {
    domain::CampaignFilter filter;
    filter.statuses = {domain::CampaignStatus::SENDING};
    domain::Pagination pagination;
    pagination.sortBy = "name";
    pagination.sortDirection = domain::SortDirection::ASC;

    auto page = service_->listCampaigns(filter, pagination);

    EXPECT_EQ(page.total, 5);
    ASSERT_EQ(page.items.size(), 5u);
    EXPECT_EQ(page.items.front().name, "Campaign 10");
}

TEST_F(CampaignQueryServiceTest, List_EmptyResult) {
    domain::CampaignFilter filter;
    filter.search = "nothing matches this";

    auto page = service_->listCampaigns(filter, {});

    EXPECT_EQ(page.total, 0);
    EXPECT_EQ(page.totalPages, 0);
    EXPECT_TRUE(page.items.empty());
}
