#pragma once

#include "ports/input/ICampaignCommandService.hpp"
#include "application/EventSourcedRepository.hpp"
#include "settings/CommandSettings.hpp"
#include <functional>
#include <memory>

namespace campaign::application {

/**
 * @brief Командный сервис кампаний
 *
 * Реализует ICampaignCommandService поверх CampaignRepository.
 *
 * При конфликте версий или временной недоступности хранилища команда
 * перечитывает кампанию и заново применяет изменение к свежему состоянию,
 * не более maxConflictRetries раз. Нарушение правил на свежем состоянии
 * возвращается как ошибка, а не сливается.
 */
class CampaignCommandService : public ports::input::ICampaignCommandService {
public:
    CampaignCommandService(std::shared_ptr<CampaignRepository> repository,
                           std::shared_ptr<settings::CommandSettings> settings);

    domain::CommandResult createCampaign(const std::string& campaignId,
                                         const domain::CampaignDraft& draft) override;

    domain::CommandResult updateCampaign(const std::string& campaignId,
                                         const domain::CampaignDraft& draft) override;

    domain::CommandResult renameCampaign(const std::string& campaignId,
                                         const std::string& name) override;

    domain::CommandResult scheduleCampaign(const std::string& campaignId,
                                           const domain::Timestamp& scheduledAt) override;

    domain::CommandResult launchCampaign(const std::string& campaignId) override;
    domain::CommandResult pauseCampaign(const std::string& campaignId) override;
    domain::CommandResult resumeCampaign(const std::string& campaignId) override;

    domain::CommandResult cancelCampaign(const std::string& campaignId,
                                         const std::string& reason) override;

    domain::CommandResult completeCampaign(const std::string& campaignId) override;

    domain::CommandResult failCampaign(const std::string& campaignId,
                                       const std::string& reason) override;

private:
    using Change = std::function<void(domain::Campaign&)>;

    domain::CommandResult execute(const std::string& operation,
                                  const std::string& campaignId,
                                  const Change& change);

    static nlohmann::json snapshotOf(const domain::Campaign& campaign);

    std::shared_ptr<CampaignRepository> repository_;
    std::shared_ptr<settings::CommandSettings> settings_;
};

} // namespace campaign::application
