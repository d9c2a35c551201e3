#pragma once

#include <vector>
#include <cstdint>
#include <stdexcept>

namespace campaign::domain {

/**
 * @brief Общая часть любого event-sourced агрегата
 *
 * Встраивается в агрегат как значение (композиция вместо наследования).
 * Работа с буфером - через свободные функции ниже.
 *
 * Инвариант: version равна числу событий, зафиксированных в журнале и
 * применённых к состоянию. Записанные, но не сохранённые события лежат в
 * pending и не влияют на version.
 */
template <typename Id, typename Event>
struct AggregateBase {
    Id id;
    int64_t version = 0;
    std::vector<Event> pending;

    explicit AggregateBase(Id aggregateId) : id(std::move(aggregateId)) {}
};

/**
 * @brief Добавить событие в буфер несохранённых
 *
 * Состояние агрегата не меняет: применение события - отдельная свёртка агрегата.
 */
template <typename Id, typename Event>
void recordEvent(AggregateBase<Id, Event>& base, Event event) {
    base.pending.push_back(std::move(event));
}

/**
 * @brief Снимок буфера несохранённых событий
 */
template <typename Id, typename Event>
std::vector<Event> pendingEvents(const AggregateBase<Id, Event>& base) {
    return base.pending;
}

template <typename Id, typename Event>
void clearPendingEvents(AggregateBase<Id, Event>& base) {
    base.pending.clear();
}

/**
 * @brief Отметить успешную фиксацию: сдвинуть версию и очистить буфер
 */
template <typename Id, typename Event>
void markCommitted(AggregateBase<Id, Event>& base, int64_t newVersion) {
    if (newVersion < base.version) {
        throw std::logic_error("Committed version cannot go backwards");
    }
    base.version = newVersion;
    clearPendingEvents(base);
}

/**
 * @brief Равенство сущностей - только по идентификатору
 */
template <typename Id, typename Event>
bool sameIdentity(const AggregateBase<Id, Event>& lhs, const AggregateBase<Id, Event>& rhs) {
    return lhs.id == rhs.id;
}

} // namespace campaign::domain
