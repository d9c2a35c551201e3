#pragma once

#include "ports/output/ICampaignReadModelRepository.hpp"
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <vector>
#include <iostream>

namespace campaign::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища read model кампаний
 *
 * Таблица: campaign_read_models
 * - id TEXT PRIMARY KEY
 * - name, description, subject TEXT (поиск)
 * - status TEXT, segment_id TEXT (фильтры)
 * - created_at, updated_at TIMESTAMPTZ (фильтр и сортировка)
 * - version BIGINT - версия потока последнего применённого события
 * - document JSONB - полная read model
 *
 * Upsert не перезаписывает строку с version >= новой.
 */
class PostgresCampaignReadModelRepository : public ports::output::ICampaignReadModelRepository {
public:
    PostgresCampaignReadModelRepository(std::shared_ptr<settings::DbSettings> dbSettings,
                                        std::shared_ptr<settings::StorageSettings> storageSettings)
        : dbSettings_(std::move(dbSettings))
        , storageSettings_(std::move(storageSettings))
    {}

    void initialize() override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS campaign_read_models (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL,
                    description TEXT NOT NULL DEFAULT '',
                    subject TEXT NOT NULL DEFAULT '',
                    status TEXT NOT NULL,
                    segment_id TEXT,
                    created_at TIMESTAMPTZ NOT NULL,
                    updated_at TIMESTAMPTZ NOT NULL,
                    version BIGINT NOT NULL,
                    document JSONB NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_campaign_rm_status ON campaign_read_models (status)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_campaign_rm_created ON campaign_read_models (created_at)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_campaign_rm_segment ON campaign_read_models (segment_id)");
            txn.commit();
            std::cout << "[PostgresCampaignReadModelRepo] Schema ready" << std::endl;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "initialize");
        }
    }

    std::optional<domain::CampaignReadModel> get(const std::string& id) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec_params(
                "SELECT document::text FROM campaign_read_models WHERE id = $1", id);
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return domain::CampaignReadModel::fromJson(nlohmann::json::parse(result[0][0].as<std::string>()));

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "get");
        }
    }

    std::vector<domain::CampaignReadModel> find(const domain::CampaignFilter& filter,
                                                const domain::Pagination& pagination) override
    {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            const char* direction = pagination.sortDirection == domain::SortDirection::ASC ? "ASC" : "DESC";
            int64_t offset = static_cast<int64_t>(std::max(0, pagination.page - 1)) * pagination.pageSize;

            std::string sql =
                "SELECT document::text FROM campaign_read_models" + whereClause(txn, filter) +
                " ORDER BY " + sortColumn(pagination.sortBy) + " " + direction + ", id " + direction +
                " LIMIT " + std::to_string(pagination.pageSize) +
                " OFFSET " + std::to_string(offset);

            auto result = txn.exec(sql);
            txn.commit();

            std::vector<domain::CampaignReadModel> models;
            models.reserve(result.size());
            for (const auto& row : result) {
                models.push_back(domain::CampaignReadModel::fromJson(nlohmann::json::parse(row[0].as<std::string>())));
            }
            return models;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "find");
        }
    }

    int64_t count(const domain::CampaignFilter& filter) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec("SELECT COUNT(*) FROM campaign_read_models" + whereClause(txn, filter));
            txn.commit();
            return result[0][0].as<int64_t>();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "count");
        }
    }

    void save(const domain::CampaignReadModel& model) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            txn.exec_params(
                R"(
                    INSERT INTO campaign_read_models (
                        id, name, description, subject, status, segment_id,
                        created_at, updated_at, version, document
                    )
                    VALUES ($1, $2, $3, $4, $5, NULLIF($6, ''),
                            to_timestamp($7::double precision / 1000.0),
                            to_timestamp($8::double precision / 1000.0),
                            $9, $10::jsonb)
                    ON CONFLICT (id) DO UPDATE SET
                        name = EXCLUDED.name,
                        description = EXCLUDED.description,
                        subject = EXCLUDED.subject,
                        status = EXCLUDED.status,
                        segment_id = EXCLUDED.segment_id,
                        created_at = EXCLUDED.created_at,
                        updated_at = EXCLUDED.updated_at,
                        version = EXCLUDED.version,
                        document = EXCLUDED.document
                    WHERE campaign_read_models.version < EXCLUDED.version
                )",
                model.id,
                model.name,
                model.description,
                model.subject,
                domain::toString(model.status),
                model.segmentId.value_or(""),
                model.createdAt.toMillis(),
                model.updatedAt.toMillis(),
                model.version,
                model.toJson().dump()
            );
            txn.commit();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "save");
        }
    }

    void clear() override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("DELETE FROM campaign_read_models");
            txn.commit();
            std::cout << "[PostgresCampaignReadModelRepo] Cleared" << std::endl;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCampaignReadModelRepo", "clear");
        }
    }

private:
    static std::string sortColumn(const std::string& sortBy) {
        if (sortBy == "name") return "name";
        if (sortBy == "updatedAt") return "updated_at";
        return "created_at";
    }

    // % и _ в строке поиска - обычные символы
    static std::string escapeLike(const std::string& value) {
        std::string escaped;
        for (char c : value) {
            if (c == '%' || c == '_' || c == '\\') {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }

    static std::string whereClause(pqxx::work& txn, const domain::CampaignFilter& filter) {
        std::vector<std::string> conditions;

        if (!filter.statuses.empty()) {
            std::string list;
            for (auto status : filter.statuses) {
                if (!list.empty()) list += ", ";
                list += txn.quote(domain::toString(status));
            }
            conditions.push_back("status IN (" + list + ")");
        }
        if (!filter.search.empty()) {
            auto pattern = txn.quote("%" + escapeLike(filter.search) + "%");
            conditions.push_back("(name ILIKE " + pattern + " OR description ILIKE " + pattern +
                                 " OR subject ILIKE " + pattern + ")");
        }
        if (filter.createdFrom) {
            conditions.push_back("created_at >= to_timestamp(" +
                                 std::to_string(filter.createdFrom->toMillis()) + "::double precision / 1000.0)");
        }
        if (filter.createdTo) {
            conditions.push_back("created_at <= to_timestamp(" +
                                 std::to_string(filter.createdTo->toMillis()) + "::double precision / 1000.0)");
        }
        if (filter.segmentId) {
            conditions.push_back("segment_id = " + txn.quote(*filter.segmentId));
        }

        std::string clause;
        for (const auto& condition : conditions) {
            clause += clause.empty() ? " WHERE " : " AND ";
            clause += condition;
        }
        return clause;
    }

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;
};

} // namespace campaign::adapters::secondary
