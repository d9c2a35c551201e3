#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace campaign::ports::output {

/**
 * @brief Журнал событий: append-only, версионированные потоки
 *
 * Output Port ядра event sourcing.
 *
 * Реализации:
 * - InMemoryEventStore - в памяти (тесты, локальный запуск)
 * - PostgresEventStore - PostgreSQL
 *
 * Все операции ограничены таймаутом; таймаут и прочие временные сбои
 * сообщаются через domain::StoreUnavailableException.
 */
class IEventStore {
public:
    virtual ~IEventStore() = default;

    /**
     * @brief Подготовить схему хранилища
     *
     * @note Идемпотентно, вызывается при каждом старте
     */
    virtual void initialize() = 0;

    /**
     * @brief Атомарно дописать события в поток
     *
     * @param streamId Идентификатор потока
     * @param expectedVersion Ожидаемая текущая версия потока (0 - поток не должен существовать)
     * @param events События в порядке записи
     * @return Новая версия потока
     *
     * @throws domain::ConcurrencyConflictException если версия потока != expectedVersion
     * @throws domain::StoreUnavailableException при таймауте или недоступности
     */
    virtual int64_t append(const std::string& streamId,
                           int64_t expectedVersion,
                           const std::vector<domain::DomainEvent>& events) = 0;

    /**
     * @brief Прочитать поток по возрастанию версий
     *
     * @return Пустой вектор, если поток не существует
     */
    virtual std::vector<domain::StoredEvent> loadStream(const std::string& streamId,
                                                        int64_t fromVersion = 1) = 0;

    /**
     * @brief Прочитать события всех потоков в глобальном порядке
     *
     * @param fromGlobalSequence Первый включаемый глобальный номер
     * @param maxCount Ограничение размера пачки (0 - без ограничения)
     */
    virtual std::vector<domain::StoredEvent> readAll(int64_t fromGlobalSequence,
                                                     size_t maxCount = 0) = 0;

    /**
     * @brief Текущая версия потока (0, если потока нет)
     */
    virtual int64_t streamVersion(const std::string& streamId) = 0;

    /**
     * @brief Последний назначенный глобальный номер (0 для пустого журнала)
     */
    virtual int64_t lastGlobalSequence() = 0;

    /**
     * @brief Закрыть хранилище; дальнейшие операции бросают StoreUnavailableException
     */
    virtual void close() = 0;
};

} // namespace campaign::ports::output
