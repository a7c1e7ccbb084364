#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace bank::domain {

/**
 * @brief Базовое исключение слоя переводов
 *
 * Иерархия:
 * - ValidationError  - некорректный запрос (amount <= 0, from == to)
 * - NotFoundError    - неизвестный id счёта или перевода
 * - ConflictError    - serialization failure / deadlock; операцию можно повторить целиком
 * - RollbackError    - ошибка операции + ошибка отката, обе причины доступны
 * - CommitError      - сбой на COMMIT, исход неизвестен, считать перевод неуспешным
 * - CancelledError   - сработала отмена или истёк дедлайн
 */
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

class ValidationError : public TransferError {
public:
    explicit ValidationError(const std::string& message)
        : TransferError(message) {}
};

class NotFoundError : public TransferError {
public:
    explicit NotFoundError(const std::string& message)
        : TransferError(message) {}
};

class ConflictError : public TransferError {
public:
    explicit ConflictError(const std::string& message)
        : TransferError(message) {}
};

class CommitError : public TransferError {
public:
    explicit CommitError(const std::string& message)
        : TransferError("commit failed: " + message) {}
};

class CancelledError : public TransferError {
public:
    explicit CancelledError(const std::string& message)
        : TransferError(message) {}
};

/**
 * @brief Операция упала, и откат тоже упал
 *
 * what() содержит обе причины: "tx err: ..., rb err: ...".
 * Исходные исключения доступны через original() / rollbackFailure().
 */
class RollbackError : public TransferError {
public:
    RollbackError(std::exception_ptr original, std::exception_ptr rollbackFailure)
        : TransferError("tx err: " + describe(original) + ", rb err: " + describe(rollbackFailure))
        , original_(std::move(original))
        , rollbackFailure_(std::move(rollbackFailure))
        , originalMessage_(describe(original_))
        , rollbackMessage_(describe(rollbackFailure_))
    {}

    const std::exception_ptr& original() const { return original_; }
    const std::exception_ptr& rollbackFailure() const { return rollbackFailure_; }
    const std::string& originalMessage() const { return originalMessage_; }
    const std::string& rollbackMessage() const { return rollbackMessage_; }

    /**
     * @brief Перебросить исходную ошибку операции (например, чтобы узнать её тип)
     */
    [[noreturn]] void rethrowOriginal() const {
        std::rethrow_exception(original_);
    }

private:
    std::exception_ptr original_;
    std::exception_ptr rollbackFailure_;
    std::string originalMessage_;
    std::string rollbackMessage_;

    static std::string describe(const std::exception_ptr& ptr) {
        if (!ptr) return "<none>";
        try {
            std::rethrow_exception(ptr);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown error";
        }
    }
};

/**
 * @brief Можно ли безопасно повторить всю операцию
 */
inline bool isRetryable(const std::exception& e) {
    return dynamic_cast<const ConflictError*>(&e) != nullptr;
}

} // namespace bank::domain
