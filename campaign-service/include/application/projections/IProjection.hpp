#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>

namespace campaign::application {

/**
 * @brief Проекция: сворачивает события журнала в read model
 *
 * Вызывается только из потока своей проекции в ProjectionManager.
 * apply должна быть идемпотентной: после сбоя между записью read model
 * и сохранением чекпоинта событие будет применено повторно.
 */
class IProjection {
public:
    virtual ~IProjection() = default;

    /// Уникальное имя - ключ чекпоинта
    virtual std::string name() const = 0;

    virtual bool handles(const std::string& eventType) const = 0;

    /**
     * @throws domain::SerializationException если событие не декодируется
     * @throws domain::ProjectionApplyException при невозможности применить
     */
    virtual void apply(const domain::StoredEvent& event) = 0;

    /// Удалить всё состояние проекции (перед перестроением)
    virtual void reset() = 0;
};

} // namespace campaign::application
