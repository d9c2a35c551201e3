#include "application/projections/ProjectionManager.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <stdexcept>

namespace campaign::application {

std::string toString(ProjectionState state) {
    switch (state) {
        case ProjectionState::STOPPED:     return "STOPPED";
        case ProjectionState::CATCHING_UP: return "CATCHING_UP";
        case ProjectionState::LIVE:        return "LIVE";
        case ProjectionState::STALLED:     return "STALLED";
    }
    return "UNKNOWN";
}

ProjectionManager::ProjectionManager(std::shared_ptr<ports::output::IEventStore> eventStore,
                                     std::shared_ptr<ports::output::ICheckpointStore> checkpoints,
                                     std::shared_ptr<settings::ProjectionSettings> settings)
    : eventStore_(std::move(eventStore))
    , checkpoints_(std::move(checkpoints))
    , settings_(std::move(settings))
{}

ProjectionManager::~ProjectionManager() {
    stop();
}

void ProjectionManager::registerProjection(std::shared_ptr<IProjection> projection) {
    if (!projection) {
        throw std::invalid_argument("Projection must not be null");
    }

    const auto name = projection->name();
    Runner* runner = nullptr;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        if (runners_.count(name) > 0) {
            throw std::invalid_argument("Projection already registered: " + name);
        }
        auto created = std::make_unique<Runner>();
        created->projection = std::move(projection);
        runner = created.get();
        runners_.emplace(name, std::move(created));
    }

    std::cout << "[ProjectionManager] Registered projection: " << name << std::endl;

    if (running_) {
        startRunner(*runner);
    }
}

void ProjectionManager::start() {
    if (running_.exchange(true)) {
        return;
    }

    std::vector<Runner*> runners;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        for (auto& [name, runner] : runners_) {
            runners.push_back(runner.get());
        }
    }

    try {
        for (auto* runner : runners) {
            startRunner(*runner);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ProjectionManager] start() failed: " << e.what() << std::endl;
        stop();
        throw;
    }

    std::cout << "[ProjectionManager] Started " << runners.size() << " projection(s)" << std::endl;
}

void ProjectionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::vector<Runner*> runners;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        for (auto& [name, runner] : runners_) {
            runners.push_back(runner.get());
        }
    }

    for (auto* runner : runners) {
        stopRunner(*runner);
    }

    std::cout << "[ProjectionManager] Stopped" << std::endl;
}

void ProjectionManager::rebuild(const std::string& name) {
    auto& runner = runnerFor(name);
    const bool restart = running_ && runner.worker.joinable();

    stopRunner(runner);

    {
        std::lock_guard<std::mutex> processingLock(runner.processing);
        // Сначала чекпоинт: при сбое между шагами проекция пройдёт журнал
        // заново по старым read model, а не пропустит события.
        checkpoints_->reset(name);
        runner.projection->reset();

        std::lock_guard<std::mutex> lock(runner.mutex);
        runner.checkpoint = 0;
        runner.eventsApplied = 0;
        runner.checkpointLoaded = true;
        runner.poison.reset();
        runner.state = ProjectionState::STOPPED;
    }

    std::cout << "[ProjectionManager] Rebuilding projection: " << name << std::endl;

    if (restart) {
        startRunner(runner);
    } else {
        catchUp(name);
    }
}

size_t ProjectionManager::catchUp(const std::string& name) {
    auto& runner = runnerFor(name);
    loadCheckpointIfNeeded(runner);

    const int64_t target = eventStore_->lastGlobalSequence();
    size_t total = 0;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(runner.mutex);
            if (runner.checkpoint >= target || runner.state == ProjectionState::STALLED) {
                break;
            }
        }
        size_t processed = processBatch(runner, false);
        total += processed;
        if (processed == 0) {
            break;
        }
    }

    std::cout << "[ProjectionManager] " << name << " caught up: " << total
              << " event(s), checkpoint " << status(name).checkpoint << std::endl;
    return total;
}

void ProjectionManager::resume(const std::string& name) {
    auto& runner = runnerFor(name);
    {
        std::lock_guard<std::mutex> lock(runner.mutex);
        if (runner.state != ProjectionState::STALLED) {
            return;
        }
        runner.poison.reset();
        runner.state = running_ ? ProjectionState::CATCHING_UP : ProjectionState::STOPPED;
    }
    runner.wakeUp.notify_all();

    std::cout << "[ProjectionManager] Resumed projection: " << name << std::endl;
}

ProjectionStatus ProjectionManager::status(const std::string& name) const {
    return snapshot(runnerFor(name));
}

std::vector<ProjectionStatus> ProjectionManager::statuses() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<ProjectionStatus> result;
    for (const auto& [name, runner] : runners_) {
        result.push_back(snapshot(*runner));
    }
    return result;
}

void ProjectionManager::onPoisonEvent(PoisonEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    poisonCallback_ = std::move(callback);
}

ProjectionManager::Runner& ProjectionManager::runnerFor(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = runners_.find(name);
    if (it == runners_.end()) {
        throw std::invalid_argument("Unknown projection: " + name);
    }
    return *it->second;
}

void ProjectionManager::startRunner(Runner& runner) {
    const auto name = runner.projection->name();
    {
        std::lock_guard<std::mutex> processingLock(runner.processing);
        int64_t checkpoint = checkpoints_->load(name);
        int64_t tail = eventStore_->lastGlobalSequence();

        std::lock_guard<std::mutex> lock(runner.mutex);
        runner.checkpoint = checkpoint;
        runner.checkpointLoaded = true;
        runner.tailAtStart = tail;
        runner.poison.reset();
        runner.state = checkpoint >= tail ? ProjectionState::LIVE : ProjectionState::CATCHING_UP;
        runner.stopRequested = false;
    }

    runner.worker = std::thread([this, &runner]() {
        runLoop(runner);
    });
}

void ProjectionManager::stopRunner(Runner& runner) {
    if (!runner.worker.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(runner.mutex);
        runner.stopRequested = true;
    }
    runner.wakeUp.notify_all();
    runner.worker.join();

    std::lock_guard<std::mutex> lock(runner.mutex);
    runner.stopRequested = false;
    runner.state = ProjectionState::STOPPED;
}

void ProjectionManager::runLoop(Runner& runner) {
    const auto name = runner.projection->name();
    std::cout << "[ProjectionManager] " << name << " worker started at checkpoint "
              << snapshot(runner).checkpoint << std::endl;

    int failures = 0;
    while (!runner.stopRequested) {
        size_t processed = 0;
        try {
            processed = processBatch(runner, true);
            failures = 0;
        } catch (const domain::StoreUnavailableException& e) {
            ++failures;
            std::cerr << "[ProjectionManager] " << name << " store unavailable"
                      << (e.isTimeout() ? " (timeout)" : "") << ": " << e.what() << std::endl;
        } catch (const std::exception& e) {
            ++failures;
            std::cerr << "[ProjectionManager] " << name << " batch failed: " << e.what() << std::endl;
        }

        if (runner.stopRequested) {
            break;
        }
        if (failures > 0) {
            pause(runner, settings_->backoffFor(failures));
        } else if (processed == 0) {
            pause(runner, settings_->getPollInterval());
        }
    }

    std::cout << "[ProjectionManager] " << name << " worker stopped" << std::endl;
}

size_t ProjectionManager::processBatch(Runner& runner, bool background) {
    std::lock_guard<std::mutex> processingLock(runner.processing);

    int64_t from = 0;
    {
        std::lock_guard<std::mutex> lock(runner.mutex);
        if (runner.state == ProjectionState::STALLED) {
            return 0;
        }
        from = runner.checkpoint + 1;
    }

    const auto name = runner.projection->name();
    auto events = eventStore_->readAll(from, settings_->getBatchSize());

    size_t processed = 0;
    for (const auto& event : events) {
        if (background && runner.stopRequested) {
            break;
        }

        const bool handled = runner.projection->handles(event.eventType());
        if (handled && !applyWithRetry(runner, event, background)) {
            break;
        }

        // Чекпоинт - только после того, как read model записана
        checkpoints_->save(name, event.globalSequence);

        std::lock_guard<std::mutex> lock(runner.mutex);
        runner.checkpoint = event.globalSequence;
        if (handled) {
            ++runner.eventsApplied;
        }
        ++processed;
    }

    if (background) {
        std::lock_guard<std::mutex> lock(runner.mutex);
        if (runner.state == ProjectionState::CATCHING_UP && runner.checkpoint >= runner.tailAtStart) {
            runner.state = ProjectionState::LIVE;
            std::cout << "[ProjectionManager] " << name << " is live at checkpoint "
                      << runner.checkpoint << std::endl;
        }
    }

    return processed;
}

bool ProjectionManager::applyWithRetry(Runner& runner, const domain::StoredEvent& event, bool background) {
    const auto name = runner.projection->name();
    const int maxRetries = settings_->getMaxApplyRetries();

    int attempt = 0;
    int outages = 0;
    while (true) {
        try {
            runner.projection->apply(event);
            return true;
        } catch (const domain::SerializationException& e) {
            markPoisoned(runner, event, e.what());
            return false;
        } catch (const domain::StoreUnavailableException& e) {
            // Недоступно хранилище read model, а не событие: бюджет повторов
            // не расходуется, ждём восстановления до stop()
            if (!background) {
                throw;
            }

            auto delay = settings_->backoffFor(++outages);
            std::cerr << "[ProjectionManager] " << name << " store unavailable while applying "
                      << event.eventType() << " #" << event.globalSequence
                      << (e.isTimeout() ? " (timeout)" : "") << ": " << e.what()
                      << ", retrying in " << delay.count() << "ms" << std::endl;

            pause(runner, delay);
            if (runner.stopRequested) {
                return false;
            }
        } catch (const std::exception& e) {
            if (++attempt > maxRetries) {
                markPoisoned(runner, event, e.what());
                return false;
            }

            auto delay = settings_->backoffFor(attempt);
            std::cerr << "[ProjectionManager] " << name << " failed to apply " << event.eventType()
                      << " #" << event.globalSequence << " (attempt " << attempt << "/" << maxRetries + 1
                      << "): " << e.what() << ", retrying in " << delay.count() << "ms" << std::endl;

            pause(runner, delay);
            if (background && runner.stopRequested) {
                return false;
            }
        }
    }
}

void ProjectionManager::markPoisoned(Runner& runner, const domain::StoredEvent& event, const std::string& error) {
    const auto name = runner.projection->name();
    PoisonEvent poison{event.globalSequence, event.eventType(), error};
    {
        std::lock_guard<std::mutex> lock(runner.mutex);
        runner.state = ProjectionState::STALLED;
        runner.poison = poison;
    }

    std::cerr << "[ProjectionManager] POISON " << name << " stalled at #" << poison.globalSequence
              << " (" << poison.eventType << " in stream " << event.streamId << "): "
              << poison.error << std::endl;

    PoisonEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = poisonCallback_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(name, poison);
    } catch (const std::exception& e) {
        std::cerr << "[ProjectionManager] Poison callback failed: " << e.what() << std::endl;
    }
}

void ProjectionManager::loadCheckpointIfNeeded(Runner& runner) {
    std::lock_guard<std::mutex> processingLock(runner.processing);
    {
        std::lock_guard<std::mutex> lock(runner.mutex);
        if (runner.checkpointLoaded) {
            return;
        }
    }

    int64_t checkpoint = checkpoints_->load(runner.projection->name());

    std::lock_guard<std::mutex> lock(runner.mutex);
    runner.checkpoint = checkpoint;
    runner.checkpointLoaded = true;
}

void ProjectionManager::pause(Runner& runner, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(runner.mutex);
    runner.wakeUp.wait_for(lock, delay, [&runner]() {
        return runner.stopRequested.load();
    });
}

ProjectionStatus ProjectionManager::snapshot(const Runner& runner) const {
    std::lock_guard<std::mutex> lock(runner.mutex);
    ProjectionStatus result;
    result.name = runner.projection->name();
    result.state = runner.state;
    result.checkpoint = runner.checkpoint;
    result.eventsApplied = runner.eventsApplied;
    result.poison = runner.poison;
    return result;
}

} // namespace campaign::application
