#pragma once

#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace campaign::ports::input {
    class ICampaignCommandService;
    class ICampaignQueryService;
}

namespace campaign::ports::output {
    class IEventStore;
    class ICheckpointStore;
    class ICampaignReadModelRepository;
}

namespace campaign::application {
    class ProjectionManager;
}

/**
 * @class CampaignApp
 * @brief Корень композиции сервиса кампаний
 *
 * 1. configureInjection() - Boost.DI: хранилища (memory или postgres по
 *    CAMPAIGN_STORAGE_BACKEND), репозиторий, проекции, сервисы
 * 2. start() - initialize() хранилищ, регистрация проекций, запуск ProjectionManager
 * 3. shutdown() - остановка проекций и закрытие журнала
 *
 * Architecture: Hexagonal (Ports & Adapters) + Event Sourcing / CQRS
 */
class CampaignApp
{
public:
    CampaignApp();
    ~CampaignApp();

    CampaignApp(const CampaignApp&) = delete;
    CampaignApp& operator=(const CampaignApp&) = delete;

    /**
     * @brief Запустить и блокироваться до stop()
     */
    void run();

    void start();

    /**
     * @brief Попросить run() завершиться (можно вызывать из обработчика сигнала)
     */
    void stop();

    void shutdown();

    std::shared_ptr<campaign::ports::input::ICampaignCommandService> commandService() const { return commandService_; }
    std::shared_ptr<campaign::ports::input::ICampaignQueryService> queryService() const { return queryService_; }
    std::shared_ptr<campaign::application::ProjectionManager> projectionManager() const { return projectionManager_; }

private:
    void configureInjection();

    template <typename Injector>
    void resolve(Injector& injector);

    void printStartupBanner();

    std::shared_ptr<campaign::ports::output::IEventStore> eventStore_;
    std::shared_ptr<campaign::ports::output::ICheckpointStore> checkpointStore_;
    std::shared_ptr<campaign::ports::output::ICampaignReadModelRepository> readModels_;
    std::shared_ptr<campaign::application::ProjectionManager> projectionManager_;
    std::shared_ptr<campaign::ports::input::ICampaignCommandService> commandService_;
    std::shared_ptr<campaign::ports::input::ICampaignQueryService> queryService_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopRequested_{false};
};
