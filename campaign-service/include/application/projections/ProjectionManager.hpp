#pragma once

#include "application/projections/IProjection.hpp"
#include "ports/output/ICheckpointStore.hpp"
#include "ports/output/IEventStore.hpp"
#include "settings/ProjectionSettings.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace campaign::application {

enum class ProjectionState { STOPPED, CATCHING_UP, LIVE, STALLED };

std::string toString(ProjectionState state);

/**
 * @brief Событие, которое проекция не смогла применить после всех повторов
 */
struct PoisonEvent {
    int64_t globalSequence = 0;
    std::string eventType;
    std::string error;
};

struct ProjectionStatus {
    std::string name;
    ProjectionState state = ProjectionState::STOPPED;
    int64_t checkpoint = 0;
    int64_t eventsApplied = 0;
    std::optional<PoisonEvent> poison;
};

using PoisonEventCallback = std::function<void(const std::string& projection, const PoisonEvent&)>;

/**
 * @brief Менеджер проекций
 *
 * Для каждой зарегистрированной проекции держит отдельный поток, который
 * читает журнал по глобальному порядку начиная с чекпоинта, применяет
 * обрабатываемые события и после каждого события сохраняет чекпоинт.
 *
 * Ошибка apply повторяется с экспоненциальной паузой (ProjectionSettings);
 * если повторы исчерпаны, проекция переходит в STALLED на этом событии
 * (чекпоинт не сдвигается) до вызова resume(). SerializationException
 * не повторяется. StoreUnavailableException из apply - сбой хранилища,
 * а не события: в фоне повторяется с паузой без ограничения числа попыток.
 * Проекции изолированы друг от друга.
 *
 * @example
 * ```cpp
 * ProjectionManager manager(eventStore, checkpoints, settings);
 * manager.registerProjection(std::make_shared<CampaignProjection>(readModels, codec));
 * manager.onPoisonEvent([](const std::string& name, const PoisonEvent& e) { ... });
 * manager.start();
 * // ...
 * manager.stop();
 * ```
 *
 * Thread-safe: да
 */
class ProjectionManager {
public:
    ProjectionManager(std::shared_ptr<ports::output::IEventStore> eventStore,
                      std::shared_ptr<ports::output::ICheckpointStore> checkpoints,
                      std::shared_ptr<settings::ProjectionSettings> settings);

    ~ProjectionManager();

    ProjectionManager(const ProjectionManager&) = delete;
    ProjectionManager& operator=(const ProjectionManager&) = delete;

    /**
     * @throws std::invalid_argument если проекция с таким именем уже есть
     */
    void registerProjection(std::shared_ptr<IProjection> projection);

    /**
     * @brief Запустить потоки всех проекций
     *
     * Каждая проекция догоняет хвост журнала, зафиксированный при старте
     * (CATCHING_UP), затем переходит в LIVE и опрашивает журнал.
     */
    void start();

    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Перестроить проекцию с нуля
     *
     * Сбрасывает чекпоинт и read model, затем заново догоняет журнал:
     * в фоне, если менеджер запущен, иначе синхронно.
     */
    void rebuild(const std::string& name);

    /**
     * @brief Синхронно догнать текущий хвост журнала в вызывающем потоке
     * @return Количество обработанных событий
     * @throws domain::StoreUnavailableException при недоступности журнала или
     *         хранилища проекции; чекпоинт остаётся на последнем применённом событии
     */
    size_t catchUp(const std::string& name);

    /**
     * @brief Снять STALLED: отравленное событие будет применено заново
     */
    void resume(const std::string& name);

    ProjectionStatus status(const std::string& name) const;
    std::vector<ProjectionStatus> statuses() const;

    void onPoisonEvent(PoisonEventCallback callback);

private:
    struct Runner {
        std::shared_ptr<IProjection> projection;
        std::thread worker;
        std::atomic<bool> stopRequested{false};

        mutable std::mutex mutex;           // поля статуса ниже
        std::condition_variable wakeUp;
        ProjectionState state = ProjectionState::STOPPED;
        int64_t checkpoint = 0;
        int64_t eventsApplied = 0;
        int64_t tailAtStart = 0;
        bool checkpointLoaded = false;
        std::optional<PoisonEvent> poison;

        std::mutex processing;              // один обработчик пачки за раз
    };

    Runner& runnerFor(const std::string& name) const;

    void startRunner(Runner& runner);
    void stopRunner(Runner& runner);
    void runLoop(Runner& runner);

    size_t processBatch(Runner& runner, bool background);
    bool applyWithRetry(Runner& runner, const domain::StoredEvent& event, bool background);
    void markPoisoned(Runner& runner, const domain::StoredEvent& event, const std::string& error);
    void loadCheckpointIfNeeded(Runner& runner);
    void pause(Runner& runner, std::chrono::milliseconds delay);

    ProjectionStatus snapshot(const Runner& runner) const;

    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::ICheckpointStore> checkpoints_;
    std::shared_ptr<settings::ProjectionSettings> settings_;

    mutable std::mutex registryMutex_;
    std::map<std::string, std::unique_ptr<Runner>> runners_;
    std::atomic<bool> running_{false};

    std::mutex callbackMutex_;
    PoisonEventCallback poisonCallback_;
};

} // namespace campaign::application
