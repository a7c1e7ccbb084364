#pragma once

#include "ports/output/IQueries.hpp"
#include "adapters/secondary/PostgresErrorMapper.hpp"
#include <pqxx/pqxx>
#include <string>

namespace bank::adapters::secondary {

/**
 * @brief PostgreSQL реализация IQueries поверх открытой pqxx-транзакции
 *
 * Не владеет ни соединением, ни транзакцией. С pqxx::work запросы идут
 * внутри транзакции, с pqxx::nontransaction - в режиме autocommit.
 */
class PostgresQueries : public ports::output::IQueries {
public:
    explicit PostgresQueries(pqxx::transaction_base& txn)
        : txn_(txn) {}

    domain::Account createAccount(const ports::output::CreateAccountParams& params) override {
        try {
            auto result = txn_.exec_params(
                "INSERT INTO accounts (owner, balance, currency) VALUES ($1, $2, $3) "
                "RETURNING " + accountColumns(),
                params.owner,
                params.balance,
                params.currency
            );
            return rowToAccount(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("createAccount");
        }
    }

    domain::Account getAccount(int64_t id) override {
        try {
            auto result = txn_.exec_params(
                "SELECT " + accountColumns() + " FROM accounts WHERE id = $1 LIMIT 1",
                id
            );
            if (result.empty()) {
                throw domain::NotFoundError("account " + std::to_string(id) + " not found");
            }
            return rowToAccount(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("getAccount");
        }
    }

    domain::Account getAccountForUpdate(int64_t id) override {
        try {
            // NO KEY UPDATE не конфликтует с KEY SHARE, который берут
            // внешние ключи entries/transfers при вставке
            auto result = txn_.exec_params(
                "SELECT " + accountColumns() + " FROM accounts WHERE id = $1 LIMIT 1 "
                "FOR NO KEY UPDATE",
                id
            );
            if (result.empty()) {
                throw domain::NotFoundError("account " + std::to_string(id) + " not found");
            }
            return rowToAccount(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("getAccountForUpdate");
        }
    }

    domain::Account updateAccount(const ports::output::UpdateAccountParams& params) override {
        try {
            auto result = txn_.exec_params(
                "UPDATE accounts SET balance = $2 WHERE id = $1 RETURNING " + accountColumns(),
                params.id,
                params.balance
            );
            if (result.empty()) {
                throw domain::NotFoundError("account " + std::to_string(params.id) + " not found");
            }
            return rowToAccount(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("updateAccount");
        }
    }

    domain::Transfer createTransfer(const ports::output::CreateTransferParams& params) override {
        try {
            auto result = txn_.exec_params(
                "INSERT INTO transfers (from_account_id, to_account_id, amount) VALUES ($1, $2, $3) "
                "RETURNING " + transferColumns(),
                params.fromAccountId,
                params.toAccountId,
                params.amount
            );
            return rowToTransfer(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("createTransfer");
        }
    }

    domain::Transfer getTransfer(int64_t id) override {
        try {
            auto result = txn_.exec_params(
                "SELECT " + transferColumns() + " FROM transfers WHERE id = $1 LIMIT 1",
                id
            );
            if (result.empty()) {
                throw domain::NotFoundError("transfer " + std::to_string(id) + " not found");
            }
            return rowToTransfer(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("getTransfer");
        }
    }

    domain::Entry createEntry(const ports::output::CreateEntryParams& params) override {
        try {
            auto result = txn_.exec_params(
                "INSERT INTO entries (account_id, amount) VALUES ($1, $2) RETURNING " + entryColumns(),
                params.accountId,
                params.amount
            );
            return rowToEntry(result[0]);
        } catch (...) {
            PostgresErrorMapper::rethrow("createEntry");
        }
    }

    std::vector<domain::Entry> listEntries(int64_t accountId) override {
        try {
            auto result = txn_.exec_params(
                "SELECT " + entryColumns() + " FROM entries WHERE account_id = $1 ORDER BY id",
                accountId
            );
            std::vector<domain::Entry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
            return entries;
        } catch (...) {
            PostgresErrorMapper::rethrow("listEntries");
        }
    }

private:
    pqxx::transaction_base& txn_;

    static std::string createdAtColumn() {
        return "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_at_us";
    }

    static std::string accountColumns() {
        return "id, owner, balance, currency, " + createdAtColumn();
    }

    static std::string entryColumns() {
        return "id, account_id, amount, " + createdAtColumn();
    }

    static std::string transferColumns() {
        return "id, from_account_id, to_account_id, amount, " + createdAtColumn();
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<int64_t>();
        account.owner = row["owner"].as<std::string>();
        account.balance = row["balance"].as<int64_t>();
        account.currency = row["currency"].as<std::string>();
        account.createdAt = domain::Timestamp::fromMicros(row["created_at_us"].as<int64_t>());
        return account;
    }

    static domain::Entry rowToEntry(const pqxx::row& row) {
        domain::Entry entry;
        entry.id = row["id"].as<int64_t>();
        entry.accountId = row["account_id"].as<int64_t>();
        entry.amount = row["amount"].as<int64_t>();
        entry.createdAt = domain::Timestamp::fromMicros(row["created_at_us"].as<int64_t>());
        return entry;
    }

    static domain::Transfer rowToTransfer(const pqxx::row& row) {
        domain::Transfer transfer;
        transfer.id = row["id"].as<int64_t>();
        transfer.fromAccountId = row["from_account_id"].as<int64_t>();
        transfer.toAccountId = row["to_account_id"].as<int64_t>();
        transfer.amount = row["amount"].as<int64_t>();
        transfer.createdAt = domain::Timestamp::fromMicros(row["created_at_us"].as<int64_t>());
        return transfer;
    }
};

} // namespace bank::adapters::secondary
