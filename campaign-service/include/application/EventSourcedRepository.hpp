#pragma once

#include "ports/output/IEventStore.hpp"
#include "domain/AggregateBase.hpp"
#include "domain/Errors.hpp"
#include "domain/Campaign.hpp"
#include "application/events/CampaignEventCodec.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace campaign::application {

/**
 * @brief Репозиторий event-sourced агрегатов
 *
 * Aggregate должен предоставлять:
 * - IdType, EventType
 * - static Aggregate blank(const IdType&)
 * - void apply(const EventType&)
 * - AggregateBase<IdType, EventType>& base()
 *
 * Codec - encode(event, id) -> DomainEvent и decode(StoredEvent) -> EventType.
 *
 * Идентификатор потока = значение идентификатора агрегата.
 */
template <typename Aggregate, typename Codec>
class EventSourcedRepository {
public:
    using Id = typename Aggregate::IdType;
    using Event = typename Aggregate::EventType;

    EventSourcedRepository(std::shared_ptr<ports::output::IEventStore> eventStore,
                           std::shared_ptr<Codec> codec)
        : eventStore_(std::move(eventStore))
        , codec_(std::move(codec))
    {}

    /**
     * @brief Восстановить агрегат свёрткой его потока
     *
     * @return std::nullopt, если в потоке нет ни одного события
     * @throws domain::SerializationException при повреждённом payload
     */
    std::optional<Aggregate> load(const Id& id) {
        auto stored = eventStore_->loadStream(id.value());
        if (stored.empty()) {
            return std::nullopt;
        }

        Aggregate aggregate = Aggregate::blank(id);
        for (const auto& record : stored) {
            aggregate.apply(codec_->decode(record));
        }
        domain::markCommitted(aggregate.base(), stored.back().version);
        return aggregate;
    }

    /**
     * @throws domain::AggregateNotFoundException если потока нет
     */
    Aggregate get(const Id& id) {
        auto aggregate = load(id);
        if (!aggregate) {
            throw domain::AggregateNotFoundException(id.value());
        }
        return std::move(*aggregate);
    }

    bool exists(const Id& id) {
        return eventStore_->streamVersion(id.value()) > 0;
    }

    /**
     * @brief Зафиксировать несохранённые события агрегата
     *
     * При конфликте исключение пробрасывается, агрегат не меняется:
     * вызывающий перечитывает его и повторяет изменение.
     *
     * @return Версия потока после сохранения
     * @throws domain::ConcurrencyConflictException
     * @throws domain::StoreUnavailableException
     */
    int64_t save(Aggregate& aggregate) {
        auto& base = aggregate.base();
        auto pending = domain::pendingEvents(base);
        if (pending.empty()) {
            return base.version;
        }

        std::vector<domain::DomainEvent> encoded;
        encoded.reserve(pending.size());
        for (const auto& event : pending) {
            encoded.push_back(codec_->encode(event, base.id));
        }

        int64_t newVersion = eventStore_->append(base.id.value(), base.version, encoded);
        domain::markCommitted(base, newVersion);
        return newVersion;
    }

private:
    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<Codec> codec_;
};

using CampaignRepository = EventSourcedRepository<domain::Campaign, CampaignEventCodec>;

} // namespace campaign::application
