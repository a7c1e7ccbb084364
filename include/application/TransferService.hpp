// include/application/TransferService.hpp
#pragma once

#include "ports/input/ITransferService.hpp"
#include "application/TransactionExecutor.hpp"
#include "application/LockOrdering.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <iostream>
#include <limits>
#include <memory>
#include <string>

namespace bank::application {

/**
 * @brief Сервис переводов между счетами
 *
 * Одна транзакция, шаги строго по порядку:
 * 1. INSERT transfers (from, to, amount)
 * 2. INSERT entries (from, -amount)
 * 3. INSERT entries (to, +amount)
 * 4. два обновления баланса (SELECT ... FOR NO KEY UPDATE, затем UPDATE)
 *    в порядке LockOrdering - меньший id первым
 *
 * Изоляция: по умолчанию READ COMMITTED, потерянных обновлений нет за счёт
 * блокировки строки при чтении баланса. При SERIALIZABLE конфликт приходит
 * как ConflictError, и повторяет его вызывающий - сервис сам не повторяет.
 */
class TransferService : public ports::input::ITransferService {
public:
    explicit TransferService(std::shared_ptr<TransactionExecutor> executor)
        : executor_(std::move(executor))
    {
        std::cout << "[TransferService] Created" << std::endl;
    }

    domain::TransferResult transferMoney(
        const domain::TransferRequest& request,
        const domain::TxOptions& options = {}) override
    {
        validate(request);

        auto result = executor_->execute([&](ports::output::IQueries& q) {
            domain::TransferResult r;

            trace(options, "create transfer");
            r.transfer = q.createTransfer({
                .fromAccountId = request.fromAccountId,
                .toAccountId = request.toAccountId,
                .amount = request.amount
            });

            trace(options, "create entry 1");
            r.fromEntry = q.createEntry({.accountId = request.fromAccountId, .amount = -request.amount});

            trace(options, "create entry 2");
            r.toEntry = q.createEntry({.accountId = request.toAccountId, .amount = request.amount});

            for (const auto& change : LockOrdering::order(request)) {
                auto updated = applyChange(q, change, options);
                if (change.accountId == request.fromAccountId) {
                    r.fromAccount = updated;
                } else {
                    r.toAccount = updated;
                }
            }
            return r;
        }, options);

        std::cout << "[TransferService] Transfer " << result.transfer.id
                  << ": " << request.fromAccountId << " -> " << request.toAccountId
                  << " amount=" << request.amount << std::endl;
        return result;
    }

private:
    std::shared_ptr<TransactionExecutor> executor_;

    static void validate(const domain::TransferRequest& request) {
        if (request.amount <= 0) {
            throw domain::ValidationError("amount must be positive, got " + std::to_string(request.amount));
        }
        if (request.fromAccountId == request.toAccountId) {
            throw domain::ValidationError("cannot transfer to the same account " +
                                          std::to_string(request.fromAccountId));
        }
    }

    static domain::Account applyChange(
        ports::output::IQueries& q,
        const BalanceChange& change,
        const domain::TxOptions& options)
    {
        trace(options, "get account " + std::to_string(change.accountId));
        auto account = q.getAccountForUpdate(change.accountId);

        if ((change.amount > 0 && account.balance > std::numeric_limits<int64_t>::max() - change.amount) ||
            (change.amount < 0 && account.balance < std::numeric_limits<int64_t>::min() - change.amount)) {
            throw domain::ValidationError("balance overflow on account " + std::to_string(account.id));
        }

        trace(options, "update account " + std::to_string(change.accountId));
        return q.updateAccount({.id = account.id, .balance = account.balance + change.amount});
    }

    static void trace(const domain::TxOptions& options, const std::string& step) {
        if (!options.label.empty()) {
            std::cout << "[TransferService] " << options.label << " " << step << std::endl;
        }
    }
};

} // namespace bank::application
