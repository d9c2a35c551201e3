#pragma once

#include "domain/Errors.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

/**
 * @file PostgresSupport.hpp
 * @brief Общие части PostgreSQL-адаптеров: таймаут операции и перевод ошибок pqxx
 */

namespace campaign::adapters::secondary::postgres {

/// SQLSTATE query_canceled: сработал statement_timeout
inline const std::string SQLSTATE_QUERY_CANCELED = "57014";

/**
 * @brief Ограничить время всех запросов текущей транзакции
 */
inline void applyStatementTimeout(pqxx::work& txn, std::chrono::milliseconds timeout) {
    txn.exec("SET LOCAL statement_timeout = " + std::to_string(timeout.count()));
}

/**
 * @brief Перебросить текущее исключение как доменное
 *
 * Вызывается только из catch-блока. Таймаут и обрыв соединения
 * становятся StoreUnavailableException; доменные исключения и прочие
 * ошибки SQL пробрасываются как есть.
 */
[[noreturn]] inline void rethrowAsStoreError(const std::string& component, const std::string& operation) {
    try {
        throw;
    } catch (const domain::EventSourcingException&) {
        throw;
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[" << component << "] " << operation << "() connection lost: " << e.what() << std::endl;
        throw domain::StoreUnavailableException(component + " " + operation + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        if (e.sqlstate() == SQLSTATE_QUERY_CANCELED) {
            std::cerr << "[" << component << "] " << operation << "() timed out" << std::endl;
            throw domain::StoreUnavailableException(component + " " + operation + " timed out", true);
        }
        std::cerr << "[" << component << "] " << operation << "() failed: " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] " << operation << "() failed: " << e.what() << std::endl;
        throw;
    }
}

} // namespace campaign::adapters::secondary::postgres
