#pragma once

#include "ports/output/ICheckpointStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace campaign::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища чекпоинтов
 *
 * Таблица: projection_checkpoints
 * - name TEXT PRIMARY KEY
 * - last_processed_global_sequence BIGINT NOT NULL
 * - updated_at TIMESTAMPTZ DEFAULT NOW()
 */
class PostgresCheckpointStore : public ports::output::ICheckpointStore {
public:
    PostgresCheckpointStore(std::shared_ptr<settings::DbSettings> dbSettings,
                            std::shared_ptr<settings::StorageSettings> storageSettings)
        : dbSettings_(std::move(dbSettings))
        , storageSettings_(std::move(storageSettings))
    {}

    void initialize() override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS projection_checkpoints (
                    name TEXT PRIMARY KEY,
                    last_processed_global_sequence BIGINT NOT NULL DEFAULT 0,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.commit();
            std::cout << "[PostgresCheckpointStore] Schema ready" << std::endl;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCheckpointStore", "initialize");
        }
    }

    int64_t load(const std::string& projectionName) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec_params(
                "SELECT last_processed_global_sequence FROM projection_checkpoints WHERE name = $1",
                projectionName
            );
            txn.commit();

            return result.empty() ? 0 : result[0][0].as<int64_t>();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCheckpointStore", "load");
        }
    }

    void save(const std::string& projectionName, int64_t globalSequence) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            txn.exec_params(
                "INSERT INTO projection_checkpoints (name, last_processed_global_sequence, updated_at) "
                "VALUES ($1, $2, NOW()) "
                "ON CONFLICT (name) DO UPDATE SET "
                "last_processed_global_sequence = EXCLUDED.last_processed_global_sequence, "
                "updated_at = NOW()",
                projectionName,
                globalSequence
            );
            txn.commit();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCheckpointStore", "save");
        }
    }

    void reset(const std::string& projectionName) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec_params("DELETE FROM projection_checkpoints WHERE name = $1", projectionName);
            txn.commit();
            std::cout << "[PostgresCheckpointStore] Reset checkpoint: " << projectionName << std::endl;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresCheckpointStore", "reset");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;
};

} // namespace campaign::adapters::secondary
