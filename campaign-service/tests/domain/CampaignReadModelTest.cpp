/**
 * @file CampaignReadModelTest.cpp
 * @brief Read model document format and filter matching
 */

#include <gtest/gtest.h>
#include "domain/CampaignReadModel.hpp"

using namespace campaign::domain;

namespace {

CampaignReadModel model(const std::string& id, const std::string& name) {
    CampaignReadModel m;
    m.id = id;
    m.name = name;
    m.description = "Quarterly digest";
    m.subject = "News from the team";
    m.fromName = "Team";
    m.fromEmail = "team@example.com";
    m.createdAt = Timestamp::fromString("2025-03-01T09:00:00.000Z");
    m.updatedAt = m.createdAt;
    m.version = 1;
    return m;
}

} // namespace

TEST(CampaignReadModelTest, Json_PreservesAllFields) {
    auto m = model("campaign-1", "Spring Sale");
    m.status = CampaignStatus::SENDING;
    m.sentAt = Timestamp::fromString("2025-03-02T09:00:00.000Z");
    m.segmentId = "vip";
    m.metadata = {{"owner", "team-a"}};
    m.stats.sent = 42;
    m.version = 5;

    auto json = m.toJson();
    EXPECT_EQ(json["status"], "SENDING");
    EXPECT_TRUE(json["completedAt"].is_null());
    EXPECT_EQ(json["stats"]["sent"], 42);

    EXPECT_EQ(CampaignReadModel::fromJson(json), m);
}

TEST(CampaignReadModelTest, Filter_EmptyMatchesEverything) {
    CampaignFilter filter;
    EXPECT_TRUE(filter.matches(model("c-1", "Anything")));
}

TEST(CampaignReadModelTest, Filter_SearchIsCaseInsensitive) {
    CampaignFilter filter;
    filter.search = "spring";
    EXPECT_TRUE(filter.matches(model("c-1", "Big SPRING Sale")));
    EXPECT_FALSE(filter.matches(model("c-2", "Winter")));

    filter.search = "QUARTERLY";
    EXPECT_TRUE(filter.matches(model("c-3", "Winter")));
}

TEST(CampaignReadModelTest, Filter_StatusesAndSegment) {
    auto m = model("c-1", "Spring");
    m.status = CampaignStatus::PAUSED;
    m.segmentId = "vip";

    CampaignFilter filter;
    filter.statuses = {CampaignStatus::SENDING, CampaignStatus::PAUSED};
    EXPECT_TRUE(filter.matches(m));

    filter.segmentId = "other";
    EXPECT_FALSE(filter.matches(m));

    filter.segmentId = "vip";
    filter.statuses = {CampaignStatus::DRAFT};
    EXPECT_FALSE(filter.matches(m));
}

TEST(CampaignReadModelTest, Filter_CreatedRangeInclusive) {
    auto m = model("c-1", "Spring");

    CampaignFilter filter;
    filter.createdFrom = m.createdAt;
    filter.createdTo = m.createdAt;
    EXPECT_TRUE(filter.matches(m));

    filter.createdFrom = m.createdAt.addSeconds(1);
    EXPECT_FALSE(filter.matches(m));
}
