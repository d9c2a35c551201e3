#pragma once

#include "ports/input/ICampaignQueryService.hpp"
#include "ports/output/ICampaignReadModelRepository.hpp"
#include <algorithm>
#include <memory>

namespace campaign::application {

/**
 * @brief Сервис запросов по кампаниям (только read model)
 */
class CampaignQueryService : public ports::input::ICampaignQueryService {
public:
    static constexpr int MAX_PAGE_SIZE = 100;

    explicit CampaignQueryService(std::shared_ptr<ports::output::ICampaignReadModelRepository> readModels)
        : readModels_(std::move(readModels))
    {}

    std::optional<domain::CampaignReadModel> getCampaign(const std::string& campaignId) override {
        if (campaignId.empty()) {
            return std::nullopt;
        }
        return readModels_->get(campaignId);
    }

    domain::PagedResult<domain::CampaignReadModel> listCampaigns(
        const domain::CampaignFilter& filter,
        const domain::Pagination& pagination) override
    {
        auto normalized = normalize(pagination);

        domain::PagedResult<domain::CampaignReadModel> result;
        result.page = normalized.page;
        result.pageSize = normalized.pageSize;
        result.total = readModels_->count(filter);
        result.totalPages = (result.total + normalized.pageSize - 1) / normalized.pageSize;
        result.items = readModels_->find(filter, normalized);
        return result;
    }

private:
    static domain::Pagination normalize(const domain::Pagination& pagination) {
        domain::Pagination p = pagination;
        p.page = std::max(1, p.page);
        p.pageSize = p.pageSize < 1 ? 10 : std::min(p.pageSize, MAX_PAGE_SIZE);
        if (p.sortBy != "createdAt" && p.sortBy != "updatedAt" && p.sortBy != "name") {
            p.sortBy = "createdAt";
        }
        return p;
    }

    std::shared_ptr<ports::output::ICampaignReadModelRepository> readModels_;
};

} // namespace campaign::application
