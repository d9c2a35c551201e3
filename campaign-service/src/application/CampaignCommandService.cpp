#include "application/CampaignCommandService.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace campaign::application {

using domain::CommandResult;
namespace ErrorCode = domain::ErrorCode;

CampaignCommandService::CampaignCommandService(std::shared_ptr<CampaignRepository> repository,
                                               std::shared_ptr<settings::CommandSettings> settings)
    : repository_(std::move(repository))
    , settings_(std::move(settings))
{}

CommandResult CampaignCommandService::createCampaign(const std::string& campaignId,
                                                     const domain::CampaignDraft& draft) {
    try {
        auto id = campaignId.empty() ? domain::CampaignId::generate() : domain::CampaignId(campaignId);
        if (repository_->exists(id)) {
            return CommandResult::failure(ErrorCode::VALIDATION_ERROR, "Campaign already exists: " + id.value());
        }

        auto campaign = domain::Campaign::create(id, draft);
        repository_->save(campaign);

        std::cout << "[CampaignCommandService] Created campaign " << id << " (" << campaign.name() << ")" << std::endl;
        return CommandResult::ok(snapshotOf(campaign));

    } catch (const domain::CampaignValidationException& e) {
        return CommandResult::failure(ErrorCode::VALIDATION_ERROR, e.what());
    } catch (const domain::ConcurrencyConflictException& e) {
        // поток появился между exists() и save()
        return CommandResult::failure(ErrorCode::CONCURRENCY_CONFLICT, e.what());
    } catch (const domain::StoreUnavailableException& e) {
        std::cerr << "[CampaignCommandService] create failed: " << e.what() << std::endl;
        return CommandResult::failure(ErrorCode::STORE_UNAVAILABLE, e.what());
    } catch (const std::invalid_argument& e) {
        return CommandResult::failure(ErrorCode::VALIDATION_ERROR, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[CampaignCommandService] create failed: " << e.what() << std::endl;
        return CommandResult::failure(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

CommandResult CampaignCommandService::updateCampaign(const std::string& campaignId,
                                                     const domain::CampaignDraft& draft) {
    return execute("update", campaignId, [&draft](domain::Campaign& campaign) {
        campaign.update(draft);
    });
}

CommandResult CampaignCommandService::renameCampaign(const std::string& campaignId,
                                                     const std::string& name) {
    return execute("rename", campaignId, [&name](domain::Campaign& campaign) {
        campaign.rename(name);
    });
}

CommandResult CampaignCommandService::scheduleCampaign(const std::string& campaignId,
                                                       const domain::Timestamp& scheduledAt) {
    return execute("schedule", campaignId, [&scheduledAt](domain::Campaign& campaign) {
        campaign.schedule(scheduledAt);
    });
}

CommandResult CampaignCommandService::launchCampaign(const std::string& campaignId) {
    return execute("launch", campaignId, [](domain::Campaign& campaign) {
        campaign.launch();
    });
}

CommandResult CampaignCommandService::pauseCampaign(const std::string& campaignId) {
    return execute("pause", campaignId, [](domain::Campaign& campaign) {
        campaign.pause();
    });
}

CommandResult CampaignCommandService::resumeCampaign(const std::string& campaignId) {
    return execute("resume", campaignId, [](domain::Campaign& campaign) {
        campaign.resume();
    });
}

CommandResult CampaignCommandService::cancelCampaign(const std::string& campaignId,
                                                     const std::string& reason) {
    return execute("cancel", campaignId, [&reason](domain::Campaign& campaign) {
        campaign.cancel(reason);
    });
}

CommandResult CampaignCommandService::completeCampaign(const std::string& campaignId) {
    return execute("complete", campaignId, [](domain::Campaign& campaign) {
        campaign.complete();
    });
}

CommandResult CampaignCommandService::failCampaign(const std::string& campaignId,
                                                   const std::string& reason) {
    return execute("fail", campaignId, [&reason](domain::Campaign& campaign) {
        campaign.fail(reason);
    });
}

CommandResult CampaignCommandService::execute(const std::string& operation,
                                              const std::string& campaignId,
                                              const Change& change) {
    if (campaignId.empty()) {
        return CommandResult::failure(ErrorCode::VALIDATION_ERROR, "Campaign id must not be empty");
    }

    const domain::CampaignId id(campaignId);
    const int maxRetries = settings_->getMaxConflictRetries();
    bool timedOut = false;

    for (int attempt = 0; ; ++attempt) {
        try {
            auto campaign = repository_->load(id);
            if (!campaign) {
                return CommandResult::failure(ErrorCode::CAMPAIGN_NOT_FOUND, "Campaign not found: " + campaignId);
            }

            change(*campaign);
            repository_->save(*campaign);

            std::cout << "[CampaignCommandService] " << operation << " " << id
                      << " -> v" << campaign->version() << std::endl;
            return CommandResult::ok(snapshotOf(*campaign));

        } catch (const domain::InvalidCampaignStateException& e) {
            if (timedOut) {
                // Переход мог быть уже применён попыткой, закончившейся таймаутом
                return CommandResult::failure(ErrorCode::INVALID_STATE, std::string(e.what()) +
                    " (an earlier attempt timed out and may have been committed)");
            }
            return CommandResult::failure(ErrorCode::INVALID_STATE, e.what());
        } catch (const domain::CampaignValidationException& e) {
            return CommandResult::failure(ErrorCode::VALIDATION_ERROR, e.what());
        } catch (const domain::ConcurrencyConflictException& e) {
            if (attempt >= maxRetries) {
                std::cerr << "[CampaignCommandService] " << operation << " " << id
                          << " gave up after " << attempt + 1 << " attempts: " << e.what() << std::endl;
                return CommandResult::failure(ErrorCode::CONCURRENCY_CONFLICT, e.what());
            }
            std::cout << "[CampaignCommandService] " << operation << " " << id
                      << " conflict, reloading (retry " << attempt + 1 << "/" << maxRetries << ")" << std::endl;
        } catch (const domain::StoreUnavailableException& e) {
            // После таймаута append исход неизвестен: повторная загрузка
            // покажет, дошли ли события до журнала.
            if (attempt >= maxRetries) {
                std::cerr << "[CampaignCommandService] " << operation << " " << id
                          << " store unavailable: " << e.what() << std::endl;
                return CommandResult::failure(ErrorCode::STORE_UNAVAILABLE, e.what());
            }
            timedOut = timedOut || e.isTimeout();
            std::cerr << "[CampaignCommandService] " << operation << " " << id
                      << " store unavailable, retrying (" << attempt + 1 << "/" << maxRetries << ")" << std::endl;
        } catch (const domain::SerializationException& e) {
            std::cerr << "[CampaignCommandService] " << operation << " " << id
                      << " cannot decode stream: " << e.what() << std::endl;
            return CommandResult::failure(ErrorCode::INTERNAL_ERROR, e.what());
        } catch (const std::exception& e) {
            // Ошибки драйвера БД, JSON и прочие непредвиденные сбои
            std::cerr << "[CampaignCommandService] " << operation << " " << id
                      << " failed: " << e.what() << std::endl;
            return CommandResult::failure(ErrorCode::INTERNAL_ERROR, e.what());
        }
    }
}

nlohmann::json CampaignCommandService::snapshotOf(const domain::Campaign& campaign) {
    const auto& state = campaign.state();
    nlohmann::json j;
    j["id"] = campaign.id().value();
    j["version"] = campaign.version();
    j["name"] = campaign.name();
    j["status"] = domain::toString(campaign.status());
    j["updatedAt"] = state.updatedAt ? nlohmann::json(state.updatedAt->toString()) : nlohmann::json(nullptr);
    return j;
}

} // namespace campaign::application
