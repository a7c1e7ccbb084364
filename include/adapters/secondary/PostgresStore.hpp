#pragma once

#include "ports/output/IStore.hpp"
#include "adapters/secondary/PostgresQueries.hpp"
#include "adapters/secondary/PostgresTransaction.hpp"
#include "adapters/secondary/PostgresErrorMapper.hpp"
#include "settings/ITransactionSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <string>

namespace bank::adapters::secondary {

/**
 * @brief Запросы без транзакции: соединение + pqxx::nontransaction на каждый вызов
 */
class PostgresDirectQueries : public ports::output::IQueries {
public:
    explicit PostgresDirectQueries(std::string connectionString)
        : connectionString_(std::move(connectionString)) {}

    domain::Account createAccount(const ports::output::CreateAccountParams& params) override {
        return run("createAccount", [&](PostgresQueries& q) { return q.createAccount(params); });
    }

    domain::Account getAccount(int64_t id) override {
        return run("getAccount", [&](PostgresQueries& q) { return q.getAccount(id); });
    }

    // Вне транзакции блокировка снимается сразу после оператора
    domain::Account getAccountForUpdate(int64_t id) override {
        return run("getAccountForUpdate", [&](PostgresQueries& q) { return q.getAccountForUpdate(id); });
    }

    domain::Account updateAccount(const ports::output::UpdateAccountParams& params) override {
        return run("updateAccount", [&](PostgresQueries& q) { return q.updateAccount(params); });
    }

    domain::Transfer createTransfer(const ports::output::CreateTransferParams& params) override {
        return run("createTransfer", [&](PostgresQueries& q) { return q.createTransfer(params); });
    }

    domain::Transfer getTransfer(int64_t id) override {
        return run("getTransfer", [&](PostgresQueries& q) { return q.getTransfer(id); });
    }

    domain::Entry createEntry(const ports::output::CreateEntryParams& params) override {
        return run("createEntry", [&](PostgresQueries& q) { return q.createEntry(params); });
    }

    std::vector<domain::Entry> listEntries(int64_t accountId) override {
        return run("listEntries", [&](PostgresQueries& q) { return q.listEntries(accountId); });
    }

private:
    std::string connectionString_;

    template <typename Func>
    auto run(const std::string& context, Func&& func) -> decltype(func(std::declval<PostgresQueries&>())) {
        try {
            pqxx::connection conn(connectionString_);
            pqxx::nontransaction txn(conn);
            PostgresQueries queries(txn);
            return func(queries);
        } catch (...) {
            PostgresErrorMapper::rethrow(context);
        }
    }
};

/**
 * @brief PostgreSQL реализация IStore
 *
 * Таблицы (создаются при старте, если BANK_DB_INIT_SCHEMA не выключен):
 * - accounts  (id, owner, balance, currency, created_at)
 * - entries   (id, account_id → accounts, amount, created_at)
 * - transfers (id, from_account_id → accounts, to_account_id → accounts, amount > 0, created_at)
 */
class PostgresStore : public ports::output::IStore {
public:
    PostgresStore(
        const std::string& connectionString,
        std::shared_ptr<settings::ITransactionSettings> settings
    ) : connectionString_(connectionString)
      , settings_(std::move(settings))
      , direct_(std::make_shared<PostgresDirectQueries>(connectionString))
    {
        std::cout << "[PostgresStore] Connecting to PostgreSQL..." << std::endl;
        try {
            pqxx::connection conn(connectionString_);
            std::cout << "[PostgresStore] Connected to " << conn.dbname() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresStore] Connection failed: " << e.what() << std::endl;
            throw;
        }

        if (settings_->shouldInitSchema()) {
            initSchema();
        }
    }

    std::shared_ptr<ports::output::IQueries> queries() override {
        return direct_;
    }

    std::unique_ptr<ports::output::ITransaction> begin(const domain::TxOptions& options) override {
        try {
            return std::make_unique<PostgresTransaction>(connectionString_, options);
        } catch (...) {
            PostgresErrorMapper::rethrow("begin");
        }
    }

private:
    std::string connectionString_;
    std::shared_ptr<settings::ITransactionSettings> settings_;
    std::shared_ptr<PostgresDirectQueries> direct_;

    void initSchema() {
        try {
            pqxx::connection conn(connectionString_);
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id BIGSERIAL PRIMARY KEY,
                    owner VARCHAR NOT NULL,
                    balance BIGINT NOT NULL,
                    currency VARCHAR NOT NULL,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS entries (
                    id BIGSERIAL PRIMARY KEY,
                    account_id BIGINT NOT NULL REFERENCES accounts (id),
                    amount BIGINT NOT NULL,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS transfers (
                    id BIGSERIAL PRIMARY KEY,
                    from_account_id BIGINT NOT NULL REFERENCES accounts (id),
                    to_account_id BIGINT NOT NULL REFERENCES accounts (id),
                    amount BIGINT NOT NULL CHECK (amount > 0),
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS entries_account_id_idx ON entries (account_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS transfers_from_to_idx ON transfers (from_account_id, to_account_id)");

            txn.commit();
            std::cout << "[PostgresStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace bank::adapters::secondary
