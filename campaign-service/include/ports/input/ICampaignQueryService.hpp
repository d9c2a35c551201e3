#pragma once

#include "domain/CampaignReadModel.hpp"
#include <optional>
#include <string>

namespace campaign::ports::input {

/**
 * @brief Интерфейс запросов по кампаниям
 *
 * Читает только read model; данные отстают от журнала на время
 * обработки события проекцией.
 */
class ICampaignQueryService {
public:
    virtual ~ICampaignQueryService() = default;

    virtual std::optional<domain::CampaignReadModel> getCampaign(const std::string& campaignId) = 0;

    /**
     * @brief Страница кампаний по фильтру
     *
     * @note page < 1 трактуется как 1; pageSize ограничен MAX_PAGE_SIZE
     */
    virtual domain::PagedResult<domain::CampaignReadModel> listCampaigns(
        const domain::CampaignFilter& filter,
        const domain::Pagination& pagination) = 0;
};

} // namespace campaign::ports::input
