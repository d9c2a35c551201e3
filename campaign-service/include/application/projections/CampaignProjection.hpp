#pragma once

#include "application/projections/IProjection.hpp"
#include "application/events/CampaignEventCodec.hpp"
#include "ports/output/ICampaignReadModelRepository.hpp"
#include <memory>

namespace campaign::application {

/**
 * @brief Проекция кампаний в CampaignReadModel
 *
 * Единственный писатель ICampaignReadModelRepository.
 * Событие с версией потока не больше model.version уже учтено и пропускается.
 */
class CampaignProjection : public IProjection {
public:
    static constexpr const char* NAME = "campaign-read-model";

    CampaignProjection(std::shared_ptr<ports::output::ICampaignReadModelRepository> readModels,
                       std::shared_ptr<CampaignEventCodec> codec);

    std::string name() const override { return NAME; }

    bool handles(const std::string& eventType) const override;

    void apply(const domain::StoredEvent& event) override;

    void reset() override;

private:
    void fold(domain::CampaignReadModel& model, const domain::CampaignEvent& event) const;

    std::shared_ptr<ports::output::ICampaignReadModelRepository> readModels_;
    std::shared_ptr<CampaignEventCodec> codec_;
};

} // namespace campaign::application
