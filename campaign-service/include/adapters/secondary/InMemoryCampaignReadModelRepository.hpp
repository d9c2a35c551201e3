#pragma once

#include "ports/output/ICampaignReadModelRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <iterator>

namespace campaign::adapters::secondary {

/**
 * @brief In-memory реализация хранилища read model кампаний
 */
class InMemoryCampaignReadModelRepository : public ports::output::ICampaignReadModelRepository {
public:
    void initialize() override {
        std::cout << "[InMemoryCampaignReadModelRepo] Initialized" << std::endl;
    }

    std::optional<domain::CampaignReadModel> get(const std::string& id) override {
        return models_.find(id);
    }

    std::vector<domain::CampaignReadModel> find(const domain::CampaignFilter& filter,
                                                const domain::Pagination& pagination) override
    {
        auto matching = filtered(filter);

        std::sort(matching.begin(), matching.end(),
            [&pagination](const domain::CampaignReadModel& a, const domain::CampaignReadModel& b) {
                int cmp = compare(a, b, pagination.sortBy);
                if (cmp == 0) {
                    cmp = a.id.compare(b.id);
                }
                return pagination.sortDirection == domain::SortDirection::ASC ? cmp < 0 : cmp > 0;
            });

        size_t offset = static_cast<size_t>(std::max(0, pagination.page - 1)) *
                        static_cast<size_t>(std::max(0, pagination.pageSize));
        if (offset >= matching.size()) {
            return {};
        }
        size_t end = std::min(matching.size(), offset + static_cast<size_t>(pagination.pageSize));
        return std::vector<domain::CampaignReadModel>(matching.begin() + offset, matching.begin() + end);
    }

    int64_t count(const domain::CampaignFilter& filter) override {
        return static_cast<int64_t>(filtered(filter).size());
    }

    void save(const domain::CampaignReadModel& model) override {
        models_.update(model.id, [&model](const std::optional<domain::CampaignReadModel>& current)
                                     -> std::optional<domain::CampaignReadModel> {
            if (current && current->version >= model.version) {
                return current;
            }
            return model;
        });
    }

    void clear() override {
        models_.clear();
    }

private:
    std::vector<domain::CampaignReadModel> filtered(const domain::CampaignFilter& filter) const {
        auto all = models_.values();
        std::vector<domain::CampaignReadModel> result;
        std::copy_if(all.begin(), all.end(), std::back_inserter(result),
            [&filter](const domain::CampaignReadModel& m) { return filter.matches(m); });
        return result;
    }

    static int compare(const domain::CampaignReadModel& a, const domain::CampaignReadModel& b,
                       const std::string& sortBy) {
        if (sortBy == "name") {
            return a.name.compare(b.name);
        }
        const auto& lhs = sortBy == "updatedAt" ? a.updatedAt : a.createdAt;
        const auto& rhs = sortBy == "updatedAt" ? b.updatedAt : b.createdAt;
        if (lhs < rhs) return -1;
        if (rhs < lhs) return 1;
        return 0;
    }

    ThreadSafeMap<std::string, domain::CampaignReadModel> models_;
};

} // namespace campaign::adapters::secondary
