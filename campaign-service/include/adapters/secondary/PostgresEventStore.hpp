#pragma once

#include "ports/output/IEventStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <algorithm>
#include <atomic>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace campaign::adapters::secondary {

/**
 * @brief PostgreSQL реализация журнала событий
 *
 * Таблица: events
 * - global_sequence BIGSERIAL PRIMARY KEY
 * - event_id UUID NOT NULL UNIQUE
 * - stream_id TEXT NOT NULL
 * - version BIGINT NOT NULL
 * - event_type TEXT NOT NULL
 * - payload JSONB NOT NULL
 * - metadata JSONB NOT NULL
 * - occurred_at TIMESTAMPTZ NOT NULL
 * - recorded_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
 * - UNIQUE (stream_id, version)
 *
 * append выполняется одной транзакцией под advisory-локом уровня
 * транзакции: глобальные номера выдаются в порядке фиксации, и читатель
 * не увидит дыру, которая потом заполнится.
 */
class PostgresEventStore : public ports::output::IEventStore {
public:
    static constexpr int64_t APPEND_LOCK_KEY = 7243001;

    PostgresEventStore(std::shared_ptr<settings::DbSettings> dbSettings,
                       std::shared_ptr<settings::StorageSettings> storageSettings)
        : dbSettings_(std::move(dbSettings))
        , storageSettings_(std::move(storageSettings))
    {
        std::cout << "[PostgresEventStore] Using " << dbSettings_->getHost() << ":"
                  << dbSettings_->getPort() << "/" << dbSettings_->getName() << std::endl;
    }

    void initialize() override {
        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS events (
                    global_sequence BIGSERIAL PRIMARY KEY,
                    event_id UUID NOT NULL UNIQUE,
                    stream_id TEXT NOT NULL,
                    version BIGINT NOT NULL,
                    event_type TEXT NOT NULL,
                    payload JSONB NOT NULL,
                    metadata JSONB NOT NULL DEFAULT '{}'::jsonb,
                    occurred_at TIMESTAMPTZ NOT NULL,
                    recorded_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    UNIQUE (stream_id, version)
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_events_stream ON events (stream_id, version)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_events_type ON events (event_type)");

            txn.commit();
            std::cout << "[PostgresEventStore] Schema ready" << std::endl;

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "initialize");
        }
    }

    int64_t append(const std::string& streamId,
                   int64_t expectedVersion,
                   const std::vector<domain::DomainEvent>& events) override
    {
        if (expectedVersion < 0) {
            throw std::invalid_argument("expectedVersion must be >= 0");
        }
        ensureOpen("append");

        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            txn.exec("SELECT pg_advisory_xact_lock(" + std::to_string(APPEND_LOCK_KEY) + ")");

            auto current = txn.exec_params(
                "SELECT COALESCE(MAX(version), 0) FROM events WHERE stream_id = $1",
                streamId
            )[0][0].as<int64_t>();

            if (current != expectedVersion) {
                throw domain::ConcurrencyConflictException(streamId, expectedVersion, current);
            }

            int64_t version = current;
            for (const auto& event : events) {
                ++version;
                txn.exec_params(
                    R"(
                        INSERT INTO events (
                            event_id, stream_id, version, event_type,
                            payload, metadata, occurred_at
                        )
                        VALUES ($1::uuid, $2, $3, $4, $5::jsonb, $6::jsonb,
                                to_timestamp($7::double precision / 1000.0))
                    )",
                    event.eventId.empty() ? utils::UuidGenerator::generate() : event.eventId,
                    streamId,
                    version,
                    event.eventType,
                    event.payload.dump(),
                    event.metadata.dump(),
                    event.occurredAt.toMillis()
                );
            }

            txn.commit();
            return version;

        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresEventStore] append() lost race on " << streamId << ": " << e.what() << std::endl;
            throw domain::ConcurrencyConflictException(streamId, expectedVersion, streamVersion(streamId));
        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "append");
        }
    }

    std::vector<domain::StoredEvent> loadStream(const std::string& streamId,
                                                int64_t fromVersion = 1) override
    {
        ensureOpen("loadStream");
        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                " WHERE stream_id = $1 AND version >= $2 ORDER BY version",
                streamId,
                fromVersion
            );
            txn.commit();

            return toStoredEvents(result);

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "loadStream");
        }
    }

    std::vector<domain::StoredEvent> readAll(int64_t fromGlobalSequence,
                                             size_t maxCount = 0) override
    {
        ensureOpen("readAll");
        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            std::string sql = std::string(SELECT_COLUMNS) +
                              " WHERE global_sequence >= $1 ORDER BY global_sequence";
            if (maxCount > 0) {
                sql += " LIMIT " + std::to_string(maxCount);
            }

            auto result = txn.exec_params(sql, fromGlobalSequence);
            txn.commit();

            return toStoredEvents(result);

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "readAll");
        }
    }

    int64_t streamVersion(const std::string& streamId) override {
        ensureOpen("streamVersion");
        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec_params(
                "SELECT COALESCE(MAX(version), 0) FROM events WHERE stream_id = $1",
                streamId
            );
            txn.commit();
            return result[0][0].as<int64_t>();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "streamVersion");
        }
    }

    int64_t lastGlobalSequence() override {
        ensureOpen("lastGlobalSequence");
        try {
            pqxx::connection conn(connectionString());
            pqxx::work txn(conn);
            postgres::applyStatementTimeout(txn, storageSettings_->getOperationTimeout());

            auto result = txn.exec("SELECT COALESCE(MAX(global_sequence), 0) FROM events");
            txn.commit();
            return result[0][0].as<int64_t>();

        } catch (const std::exception&) {
            postgres::rethrowAsStoreError("PostgresEventStore", "lastGlobalSequence");
        }
    }

    void close() override {
        if (!closed_.exchange(true)) {
            std::cout << "[PostgresEventStore] Closed" << std::endl;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT global_sequence, event_id::text, stream_id, version, event_type,
               payload::text, metadata::text,
               (EXTRACT(EPOCH FROM occurred_at) * 1000)::BIGINT,
               (EXTRACT(EPOCH FROM recorded_at) * 1000)::BIGINT
        FROM events
    )";

    std::string connectionString() const {
        auto timeoutSec = std::max<int64_t>(1, storageSettings_->getOperationTimeout().count() / 1000);
        return dbSettings_->getConnectionString() + " connect_timeout=" + std::to_string(timeoutSec);
    }

    void ensureOpen(const char* operation) const {
        if (closed_) {
            throw domain::StoreUnavailableException(std::string("Event store is closed (") + operation + ")");
        }
    }

    static std::vector<domain::StoredEvent> toStoredEvents(const pqxx::result& result) {
        std::vector<domain::StoredEvent> events;
        events.reserve(result.size());
        for (const auto& row : result) {
            domain::StoredEvent stored;
            stored.globalSequence = row[0].as<int64_t>();
            stored.event.eventId = row[1].as<std::string>();
            stored.streamId = row[2].as<std::string>();
            stored.event.aggregateId = stored.streamId;
            stored.version = row[3].as<int64_t>();
            stored.event.eventType = row[4].as<std::string>();
            stored.event.payload = nlohmann::json::parse(row[5].as<std::string>());
            stored.event.metadata = nlohmann::json::parse(row[6].as<std::string>());
            stored.event.occurredAt = domain::Timestamp::fromMillis(row[7].as<int64_t>());
            stored.recordedAt = domain::Timestamp::fromMillis(row[8].as<int64_t>());
            events.push_back(std::move(stored));
        }
        return events;
    }

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;
    std::atomic<bool> closed_{false};
};

} // namespace campaign::adapters::secondary
