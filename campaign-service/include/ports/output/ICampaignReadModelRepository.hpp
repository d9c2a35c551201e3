#pragma once

#include "domain/CampaignReadModel.hpp"
#include <optional>
#include <string>
#include <vector>

namespace campaign::ports::output {

/**
 * @brief Хранилище read model кампаний
 *
 * Отдельное от журнала, запрашиваемое хранилище.
 * Пишет только CampaignProjection, читает query-сторона.
 */
class ICampaignReadModelRepository {
public:
    virtual ~ICampaignReadModelRepository() = default;

    virtual void initialize() = 0;

    virtual std::optional<domain::CampaignReadModel> get(const std::string& id) = 0;

    /**
     * @brief Страница кампаний, удовлетворяющих фильтру
     */
    virtual std::vector<domain::CampaignReadModel> find(const domain::CampaignFilter& filter,
                                                        const domain::Pagination& pagination) = 0;

    virtual int64_t count(const domain::CampaignFilter& filter) = 0;

    /**
     * @brief Сохранить (upsert) read model
     *
     * @note Запись с version не больше уже сохранённой игнорируется
     */
    virtual void save(const domain::CampaignReadModel& model) = 0;

    /**
     * @brief Удалить все read model (перестроение проекции)
     */
    virtual void clear() = 0;
};

} // namespace campaign::ports::output
