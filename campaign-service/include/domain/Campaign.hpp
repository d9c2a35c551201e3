#pragma once

#include "AggregateBase.hpp"
#include "CampaignDraft.hpp"
#include "Identifier.hpp"
#include "Timestamp.hpp"
#include "enums/CampaignStatus.hpp"
#include "events/CampaignEvents.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace campaign::domain {

/**
 * @brief Состояние кампании, получаемое свёрткой событий
 */
struct CampaignState {
    bool created = false;
    CampaignDraft details;
    CampaignStatus status = CampaignStatus::DRAFT;
    std::optional<Timestamp> createdAt;
    std::optional<Timestamp> updatedAt;
    std::optional<Timestamp> scheduledAt;
    std::optional<Timestamp> sentAt;
    std::optional<Timestamp> completedAt;

    bool operator==(const CampaignState& other) const {
        return created == other.created && details == other.details &&
               status == other.status && createdAt == other.createdAt &&
               updatedAt == other.updatedAt && scheduledAt == other.scheduledAt &&
               sentAt == other.sentAt && completedAt == other.completedAt;
    }
    bool operator!=(const CampaignState& other) const { return !(*this == other); }
};

/**
 * @brief Агрегат «Кампания»
 *
 * Каждый бизнес-метод проверяет правила, затем порождает событие, которое
 * сразу применяется к состоянию (apply) и кладётся в буфер несохранённых.
 * Та же apply используется репозиторием при восстановлении из журнала.
 * При нарушении правил метод бросает исключение и ничего не записывает.
 */
class Campaign {
public:
    using IdType = CampaignId;
    using EventType = CampaignEvent;

    /// Пустой агрегат для восстановления из журнала
    static Campaign blank(const CampaignId& id);

    /**
     * @brief Создать новую кампанию (CampaignCreated)
     * @throws CampaignValidationException при некорректном draft
     */
    static Campaign create(const CampaignId& id, const CampaignDraft& draft,
                           const Timestamp& now = Timestamp::now());

    void update(const CampaignDraft& draft, const Timestamp& now = Timestamp::now());
    void rename(const std::string& name, const Timestamp& now = Timestamp::now());
    void schedule(const Timestamp& scheduledAt, const Timestamp& now = Timestamp::now());
    void launch(const Timestamp& now = Timestamp::now());
    void pause(const Timestamp& now = Timestamp::now());
    void resume(const Timestamp& now = Timestamp::now());
    void cancel(const std::string& reason = "", const Timestamp& now = Timestamp::now());
    void complete(const Timestamp& now = Timestamp::now());
    void fail(const std::string& reason, const Timestamp& now = Timestamp::now());

    /**
     * @brief Свёртка: применить событие к состоянию
     *
     * Не проверяет бизнес-правила: событие уже произошло.
     */
    void apply(const CampaignEvent& event);

    const CampaignId& id() const { return base_.id; }
    int64_t version() const { return base_.version; }
    bool exists() const { return state_.created; }

    const CampaignState& state() const { return state_; }
    const std::string& name() const { return state_.details.name; }
    CampaignStatus status() const { return state_.status; }
    const nlohmann::json& metadata() const { return state_.details.metadata; }

    AggregateBase<CampaignId, CampaignEvent>& base() { return base_; }
    const AggregateBase<CampaignId, CampaignEvent>& base() const { return base_; }

    bool operator==(const Campaign& other) const { return sameIdentity(base_, other.base_); }
    bool operator!=(const Campaign& other) const { return !(*this == other); }

private:
    explicit Campaign(const CampaignId& id) : base_(id) {}

    void raise(CampaignEvent event);
    void requireCreated() const;
    void requireStatus(bool allowed, const std::string& operation) const;
    static void validate(const CampaignDraft& draft);

    AggregateBase<CampaignId, CampaignEvent> base_;
    CampaignState state_;
};

} // namespace campaign::domain
