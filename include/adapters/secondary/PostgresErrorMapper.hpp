#pragma once

#include "domain/errors/TransferErrors.hpp"
#include <pqxx/pqxx>
#include <string>

namespace bank::adapters::secondary {

/**
 * @brief Перевод исключений libpqxx в домен
 *
 * Вызывать только внутри catch-блока: текущее исключение перебрасывается
 * уже как domain::TransferError или его наследник.
 *
 * SQLSTATE:
 * - 40001 serialization_failure, 40P01 deadlock_detected → ConflictError
 * - 23503 foreign_key_violation                           → NotFoundError
 * - 57014 query_canceled (statement_timeout, cancel())    → CancelledError
 */
class PostgresErrorMapper {
public:
    [[noreturn]] static void rethrow(const std::string& context) {
        try {
            throw;
        } catch (const domain::TransferError&) {
            throw;
        } catch (const pqxx::serialization_failure& e) {
            throw domain::ConflictError(context + ": serialization failure: " + e.what());
        } catch (const pqxx::deadlock_detected& e) {
            throw domain::ConflictError(context + ": deadlock detected: " + e.what());
        } catch (const pqxx::foreign_key_violation& e) {
            throw domain::NotFoundError(context + ": " + e.what());
        } catch (const pqxx::sql_error& e) {
            const std::string state = e.sqlstate();
            if (state == "57014") {
                throw domain::CancelledError(context + ": statement cancelled: " + e.what());
            }
            if (state.rfind("40", 0) == 0) {
                throw domain::ConflictError(context + ": " + e.what());
            }
            throw domain::TransferError(context + ": " + e.what());
        } catch (const std::exception& e) {
            throw domain::TransferError(context + ": " + e.what());
        }
    }

    /**
     * @brief То же для сбоя COMMIT
     *
     * Откат по serialization/deadlock гарантирован сервером → ConflictError.
     * Остальное (in_doubt, обрыв соединения) - исход неизвестен → CommitError.
     */
    [[noreturn]] static void rethrowCommitFailure() {
        try {
            throw;
        } catch (const domain::TransferError&) {
            throw;
        } catch (const pqxx::transaction_rollback& e) {
            throw domain::ConflictError(std::string("commit: ") + e.what());
        } catch (const pqxx::in_doubt_error& e) {
            throw domain::CommitError(std::string("in doubt: ") + e.what());
        } catch (const std::exception& e) {
            throw domain::CommitError(e.what());
        }
    }
};

} // namespace bank::adapters::secondary
