#pragma once

#include "domain/CampaignDraft.hpp"
#include "domain/CommandResult.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace campaign::ports::input {

/**
 * @brief Интерфейс командной стороны кампаний
 *
 * Input Port: каждая команда загружает агрегат из журнала, применяет
 * изменение и сохраняет новые события. Ошибки не бросаются, а
 * возвращаются в CommandResult.
 */
class ICampaignCommandService {
public:
    virtual ~ICampaignCommandService() = default;

    /**
     * @brief Создать кампанию
     *
     * @param campaignId ID новой кампании (пустой - сгенерировать)
     * @param draft Содержимое кампании
     */
    virtual domain::CommandResult createCampaign(const std::string& campaignId,
                                                 const domain::CampaignDraft& draft) = 0;

    /**
     * @note Только в статусе DRAFT или SCHEDULED
     */
    virtual domain::CommandResult updateCampaign(const std::string& campaignId,
                                                 const domain::CampaignDraft& draft) = 0;

    virtual domain::CommandResult renameCampaign(const std::string& campaignId,
                                                 const std::string& name) = 0;

    /**
     * @param scheduledAt Время отправки, должно быть в будущем
     */
    virtual domain::CommandResult scheduleCampaign(const std::string& campaignId,
                                                   const domain::Timestamp& scheduledAt) = 0;

    virtual domain::CommandResult launchCampaign(const std::string& campaignId) = 0;
    virtual domain::CommandResult pauseCampaign(const std::string& campaignId) = 0;
    virtual domain::CommandResult resumeCampaign(const std::string& campaignId) = 0;

    virtual domain::CommandResult cancelCampaign(const std::string& campaignId,
                                                 const std::string& reason) = 0;

    virtual domain::CommandResult completeCampaign(const std::string& campaignId) = 0;

    virtual domain::CommandResult failCampaign(const std::string& campaignId,
                                               const std::string& reason) = 0;
};

} // namespace campaign::ports::input
