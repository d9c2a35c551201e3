#include "CampaignApp.hpp"

// Application
#include "application/CampaignCommandService.hpp"
#include "application/CampaignQueryService.hpp"
#include "application/EventSourcedRepository.hpp"
#include "application/events/CampaignEventCodec.hpp"
#include "application/projections/CampaignProjection.hpp"
#include "application/projections/ProjectionManager.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryEventStore.hpp"
#include "adapters/secondary/InMemoryCheckpointStore.hpp"
#include "adapters/secondary/InMemoryCampaignReadModelRepository.hpp"
#include "adapters/secondary/PostgresEventStore.hpp"
#include "adapters/secondary/PostgresCheckpointStore.hpp"
#include "adapters/secondary/PostgresCampaignReadModelRepository.hpp"

// Settings
#include "settings/CommandSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/ProjectionSettings.hpp"
#include "settings/StorageSettings.hpp"

#include <boost/di.hpp>
#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

using namespace campaign;

// ============================================================================
// CampaignApp Implementation
// ============================================================================

CampaignApp::CampaignApp()
{
    std::cout << "[CampaignApp] Application created" << std::endl;
}

CampaignApp::~CampaignApp()
{
    shutdown();
    std::cout << "[CampaignApp] Application destroyed" << std::endl;
}

void CampaignApp::run()
{
    start();

    while (!stopRequested_)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    shutdown();
}

void CampaignApp::start()
{
    if (started_.exchange(true))
    {
        return;
    }

    printStartupBanner();
    configureInjection();

    // Схема хранилищ создаётся идемпотентно при каждом старте
    eventStore_->initialize();
    checkpointStore_->initialize();
    readModels_->initialize();

    projectionManager_->onPoisonEvent(
        [](const std::string& projection, const application::PoisonEvent& poison)
        {
            std::cerr << "[CampaignApp] ALERT: projection " << projection
                      << " stalled at #" << poison.globalSequence
                      << " (" << poison.eventType << "): " << poison.error << std::endl;
        });
    projectionManager_->start();

    for (const auto& status : projectionManager_->statuses())
    {
        std::cout << "  ✓ " << status.name << ": " << application::toString(status.state)
                  << " (checkpoint " << status.checkpoint << ")" << std::endl;
    }
}

void CampaignApp::stop()
{
    stopRequested_ = true;
}

void CampaignApp::shutdown()
{
    if (!started_.exchange(false))
    {
        return;
    }

    std::cout << "[CampaignApp] Shutting down..." << std::endl;
    if (projectionManager_)
    {
        projectionManager_->stop();
    }
    if (eventStore_)
    {
        eventStore_->close();
    }
    std::cout << "[CampaignApp] Shutdown complete" << std::endl;
}

void CampaignApp::configureInjection()
{
    std::cout << "[CampaignApp] Configuring Boost.DI injection..." << std::endl;

    auto storageSettings = std::make_shared<settings::StorageSettings>();

    if (storageSettings->getBackend() == settings::StorageSettings::Backend::POSTGRES)
    {
        auto injector = di::make_injector(
            // ================================================================
            // Layer 1: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<settings::StorageSettings>().to(storageSettings),
            di::bind<settings::DbSettings>().in(di::singleton),

            di::bind<ports::output::IEventStore>()
                .to<adapters::secondary::PostgresEventStore>()
                .in(di::singleton),

            di::bind<ports::output::ICheckpointStore>()
                .to<adapters::secondary::PostgresCheckpointStore>()
                .in(di::singleton),

            di::bind<ports::output::ICampaignReadModelRepository>()
                .to<adapters::secondary::PostgresCampaignReadModelRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::ICampaignCommandService>()
                .to<application::CampaignCommandService>()
                .in(di::singleton),

            di::bind<ports::input::ICampaignQueryService>()
                .to<application::CampaignQueryService>()
                .in(di::singleton));

        std::cout << "  ✓ Storage backend: postgres" << std::endl;
        resolve(injector);
    }
    else
    {
        auto injector = di::make_injector(
            // ================================================================
            // Layer 1: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<settings::StorageSettings>().to(storageSettings),

            di::bind<ports::output::IEventStore>()
                .to<adapters::secondary::InMemoryEventStore>()
                .in(di::singleton),

            di::bind<ports::output::ICheckpointStore>()
                .to<adapters::secondary::InMemoryCheckpointStore>()
                .in(di::singleton),

            di::bind<ports::output::ICampaignReadModelRepository>()
                .to<adapters::secondary::InMemoryCampaignReadModelRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::ICampaignCommandService>()
                .to<application::CampaignCommandService>()
                .in(di::singleton),

            di::bind<ports::input::ICampaignQueryService>()
                .to<application::CampaignQueryService>()
                .in(di::singleton));

        std::cout << "  ✓ Storage backend: memory" << std::endl;
        resolve(injector);
    }
}

template <typename Injector>
void CampaignApp::resolve(Injector& injector)
{
    eventStore_ = injector.template create<std::shared_ptr<ports::output::IEventStore>>();
    checkpointStore_ = injector.template create<std::shared_ptr<ports::output::ICheckpointStore>>();
    readModels_ = injector.template create<std::shared_ptr<ports::output::ICampaignReadModelRepository>>();
    commandService_ = injector.template create<std::shared_ptr<ports::input::ICampaignCommandService>>();
    queryService_ = injector.template create<std::shared_ptr<ports::input::ICampaignQueryService>>();
    projectionManager_ = injector.template create<std::shared_ptr<application::ProjectionManager>>();

    // ========================================================================
    // Layer 3: Projections
    // ========================================================================
    projectionManager_->registerProjection(
        injector.template create<std::shared_ptr<application::CampaignProjection>>());

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (3 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (2 bindings)" << std::endl;
    std::cout << "  ✓ Projections (1 registered)" << std::endl;
}

void CampaignApp::printStartupBanner()
{
    std::cout << R"(
   ____                            _             
  / ___|__ _ _ __ ___  _ __   __ _(_) __ _ _ __  
 | |   / _` | '_ ` _ \| '_ \ / _` | |/ _` | '_ \ 
 | |__| (_| | | | | | | |_) | (_| | | (_| | | | |
  \____\__,_|_| |_| |_| .__/ \__,_|_|\__, |_| |_|
                      |_|            |___/       
    )" << std::endl;
    std::cout << "  Event-sourced campaign service" << std::endl;
    std::cout << std::endl;
}
