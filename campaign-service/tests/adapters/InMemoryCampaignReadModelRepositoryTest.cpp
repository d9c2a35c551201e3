/**
 * @file InMemoryCampaignReadModelRepositoryTest.cpp
 * @brief Unit tests for in-memory read model and checkpoint stores
 */

#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryCampaignReadModelRepository.hpp"
#include "adapters/secondary/InMemoryCheckpointStore.hpp"

using namespace campaign::domain;
using namespace campaign::adapters::secondary;

class InMemoryCampaignReadModelRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto base = Timestamp::fromString("2025-01-01T00:00:00.000Z");
        add("c-1", "Bravo", base, CampaignStatus::DRAFT);
        add("c-2", "alpha", base.addHours(1), CampaignStatus::SENDING);
        add("c-3", "Charlie", base.addHours(2), CampaignStatus::DRAFT);
    }

    void add(const std::string& id, const std::string& name, Timestamp createdAt, CampaignStatus status) {
        CampaignReadModel m;
        m.id = id;
        m.name = name;
        m.status = status;
        m.createdAt = createdAt;
        m.updatedAt = createdAt;
        m.version = 1;
        repo_.save(m);
    }

    static std::vector<std::string> ids(const std::vector<CampaignReadModel>& models) {
        std::vector<std::string> result;
        for (const auto& m : models) result.push_back(m.id);
        return result;
    }

    InMemoryCampaignReadModelRepository repo_;
};

TEST_F(InMemoryCampaignReadModelRepositoryTest, Find_DefaultsToNewestFirst) {
    auto page = repo_.find({}, Pagination{});
    EXPECT_EQ(ids(page), (std::vector<std::string>{"c-3", "c-2", "c-1"}));
}

TEST_F(InMemoryCampaignReadModelRepositoryTest, Find_SortByNameAscending) {
    Pagination p;
    p.sortBy = "name";
    p.sortDirection = SortDirection::ASC;

    auto page = repo_.find({}, p);
    // сравнение побайтовое: заглавные раньше строчных
    EXPECT_EQ(ids(page), (std::vector<std::string>{"c-1", "c-3", "c-2"}));
}

TEST_F(InMemoryCampaignReadModelRepositoryTest, Find_Paginates) {
    Pagination p;
    p.pageSize = 2;
    p.page = 2;

    auto page = repo_.find({}, p);
    EXPECT_EQ(ids(page), (std::vector<std::string>{"c-1"}));

    p.page = 3;
    EXPECT_TRUE(repo_.find({}, p).empty());
}

TEST_F(InMemoryCampaignReadModelRepositoryTest, CountAndFilter) {
    CampaignFilter filter;
    filter.statuses = {CampaignStatus::DRAFT};

    EXPECT_EQ(repo_.count(filter), 2);
    EXPECT_EQ(repo_.count({}), 3);
}

TEST_F(InMemoryCampaignReadModelRepositoryTest, Save_IgnoresStaleVersion) {
    auto current = *repo_.get("c-1");
    current.name = "Renamed";
    current.version = 2;
    repo_.save(current);

    auto stale = current;
    stale.name = "Stale";
    stale.version = 2;
    repo_.save(stale);

    EXPECT_EQ(repo_.get("c-1")->name, "Renamed");
}

TEST_F(InMemoryCampaignReadModelRepositoryTest, Clear_RemovesAll) {
    repo_.clear();
    EXPECT_EQ(repo_.count({}), 0);
    EXPECT_FALSE(repo_.get("c-1").has_value());
}

// ============================================================================
// CHECKPOINTS
// ============================================================================

TEST(InMemoryCheckpointStoreTest, LoadSaveReset) {
    InMemoryCheckpointStore store;
    EXPECT_EQ(store.load("p"), 0);

    store.save("p", 42);
    EXPECT_EQ(store.load("p"), 42);
    EXPECT_EQ(store.load("other"), 0);

    store.reset("p");
    EXPECT_EQ(store.load("p"), 0);
}
