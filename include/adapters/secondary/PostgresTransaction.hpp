#pragma once

#include "ports/output/ITransaction.hpp"
#include "adapters/secondary/PostgresQueries.hpp"
#include "adapters/secondary/PostgresErrorMapper.hpp"
#include "domain/TxOptions.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace bank::adapters::secondary {

/**
 * @brief Транзакция PostgreSQL на собственном соединении
 *
 * Соединение открывается в конструкторе и живёт ровно столько, сколько
 * транзакция, поэтому конкурентные единицы работы никогда не делят его.
 * Деструктор pqxx::work делает ROLLBACK, если не было commit().
 *
 * Пока транзакция жива, cancel() токена из TxOptions отправляет серверу
 * запрос отмены текущего оператора; сервер отвечает SQLSTATE 57014,
 * который приходит как domain::CancelledError.
 */
class PostgresTransaction : public ports::output::ITransaction {
public:
    PostgresTransaction(const std::string& connectionString, const domain::TxOptions& options)
        : connection_(std::make_unique<pqxx::connection>(connectionString))
        , work_(std::make_unique<pqxx::work>(*connection_))
        , queries_(*work_)
    {
        if (options.isolation) {
            work_->exec("SET TRANSACTION ISOLATION LEVEL " + domain::toSql(*options.isolation));
        }
        if (auto timeout = options.effectiveTimeout()) {
            // 0 в PostgreSQL означает "без таймаута"
            auto ms = std::max<int64_t>(timeout->count(), 1);
            work_->exec("SET LOCAL statement_timeout = " + std::to_string(ms));
        }
        if (options.cancellation) {
            pqxx::connection* connection = connection_.get();
            cancelRegistration_ = domain::CancellationToken::onCancel(
                options.cancellation,
                [connection]() {
                    try {
                        connection->cancel_query();
                    } catch (const std::exception& e) {
                        std::cerr << "[PostgresTransaction] cancel_query failed: " << e.what() << std::endl;
                    }
                });
        }
    }

    ports::output::IQueries& queries() override {
        return queries_;
    }

    void commit() override {
        // Отмена проверена перед COMMIT; сам COMMIT не прерываем
        cancelRegistration_.reset();
        try {
            work_->commit();
        } catch (...) {
            PostgresErrorMapper::rethrowCommitFailure();
        }
    }

    void rollback() override {
        try {
            work_->abort();
        } catch (...) {
            PostgresErrorMapper::rethrow("rollback");
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> work_;
    PostgresQueries queries_;
    // Снимается первым: обработчик отмены не переживает соединение
    domain::CancellationToken::Registration cancelRegistration_;
};

} // namespace bank::adapters::secondary
