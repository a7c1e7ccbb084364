// include/application/TransactionExecutor.hpp
#pragma once

#include "application/CancellableQueries.hpp"
#include "ports/output/IStore.hpp"
#include "settings/ITransactionSettings.hpp"
#include "domain/TxOptions.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <type_traits>

namespace bank::application {

/**
 * @brief Выполняет единицу работы внутри транзакции
 *
 * Алгоритм execute():
 * 1. BEGIN (уровень изоляции из TxOptions или из настроек)
 * 2. единица работы получает IQueries, привязанный к транзакции
 * 3. исключение → ROLLBACK и проброс исходной ошибки;
 *    если упал и ROLLBACK - RollbackError с обеими причинами
 * 4. успех → COMMIT; сбой COMMIT → CommitError (ConflictError пробрасывается как есть)
 *
 * Состояния не хранит: каждый вызов работает со своей транзакцией и своим
 * соединением, поэтому execute() можно звать из многих потоков.
 *
 * @example
 * ```cpp
 * auto account = executor->execute([](ports::output::IQueries& q) {
 *     auto acc = q.getAccountForUpdate(1);
 *     return q.updateAccount({acc.id, acc.balance + 10});
 * });
 * ```
 */
class TransactionExecutor {
public:
    TransactionExecutor(
        std::shared_ptr<ports::output::IStore> store,
        std::shared_ptr<settings::ITransactionSettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {
        std::cout << "[TransactionExecutor] Created, default isolation="
                  << domain::toString(settings_->getDefaultIsolation()) << std::endl;
    }

    template <typename Func>
    auto execute(Func&& unitOfWork, const domain::TxOptions& options = {})
        -> std::invoke_result_t<Func&, ports::output::IQueries&>
    {
        using Result = std::invoke_result_t<Func&, ports::output::IQueries&>;

        auto resolved = resolve(options);
        if (resolved.cancellation) {
            resolved.cancellation->throwIfCancelled();
        }

        std::unique_ptr<ports::output::ITransaction> tx = store_->begin(resolved);

        ports::output::IQueries* queries = &tx->queries();
        std::optional<CancellableQueries> guarded;
        if (resolved.cancellation) {
            guarded.emplace(*queries, resolved.cancellation);
            queries = &*guarded;
        }

        if constexpr (std::is_void_v<Result>) {
            try {
                unitOfWork(*queries);
                if (resolved.cancellation) {
                    resolved.cancellation->throwIfCancelled();
                }
            } catch (...) {
                rollbackAfterFailure(*tx, std::current_exception(), resolved.label);
            }
            commit(*tx, resolved.label);
        } else {
            std::optional<Result> result;
            try {
                result.emplace(unitOfWork(*queries));
                if (resolved.cancellation) {
                    resolved.cancellation->throwIfCancelled();
                }
            } catch (...) {
                rollbackAfterFailure(*tx, std::current_exception(), resolved.label);
            }
            commit(*tx, resolved.label);
            return std::move(*result);
        }
    }

private:
    std::shared_ptr<ports::output::IStore> store_;
    std::shared_ptr<settings::ITransactionSettings> settings_;

    domain::TxOptions resolve(const domain::TxOptions& options) const {
        domain::TxOptions resolved = options;
        if (!resolved.isolation) {
            resolved.isolation = settings_->getDefaultIsolation();
        }
        if (!resolved.timeout && settings_->getStatementTimeout().count() > 0) {
            resolved.timeout = settings_->getStatementTimeout();
        }
        return resolved;
    }

    [[noreturn]] static void rollbackAfterFailure(
        ports::output::ITransaction& tx,
        std::exception_ptr original,
        const std::string& label)
    {
        try {
            tx.rollback();
        } catch (...) {
            domain::RollbackError error(original, std::current_exception());
            std::cerr << "[TransactionExecutor] " << tagged(label) << error.what() << std::endl;
            throw error;
        }
        std::rethrow_exception(original);
    }

    static void commit(ports::output::ITransaction& tx, const std::string& label) {
        try {
            tx.commit();
        } catch (const domain::ConflictError& e) {
            std::cerr << "[TransactionExecutor] " << tagged(label) << "conflict on commit: " << e.what() << std::endl;
            throw;
        } catch (const domain::CommitError& e) {
            std::cerr << "[TransactionExecutor] " << tagged(label) << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[TransactionExecutor] " << tagged(label) << "commit failed: " << e.what() << std::endl;
            throw domain::CommitError(e.what());
        }
    }

    static std::string tagged(const std::string& label) {
        return label.empty() ? std::string() : label + ": ";
    }
};

} // namespace bank::application
