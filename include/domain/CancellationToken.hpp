#pragma once

#include "errors/TransferErrors.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace bank::domain {

/**
 * @brief Сигнал отмены, общий для вызывающего и транзакции
 *
 * Передаётся через TxOptions как shared_ptr: вызывающий может вызвать cancel()
 * из другого потока, транзакция проверяет флаг перед каждым запросом.
 * Хранилище прерывает уже выполняющийся запрос через onCancel().
 *
 * @example
 * ```cpp
 * auto token = CancellationToken::withTimeout(std::chrono::milliseconds(500));
 * TxOptions options;
 * options.cancellation = token;
 * service->transferMoney(request, options);
 * ```
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    explicit CancellationToken(Clock::time_point deadline)
        : deadline_(deadline) {}

    static std::shared_ptr<CancellationToken> withTimeout(std::chrono::milliseconds timeout) {
        return std::make_shared<CancellationToken>(Clock::now() + timeout);
    }

    using Callback = std::function<void()>;

    /**
     * @brief Подписка на cancel() на время жизни объекта
     *
     * Деструктор снимает обработчик; если он в этот момент выполняется
     * в другом потоке, деструктор дождётся его завершения.
     */
    class Registration {
    public:
        Registration() = default;

        Registration(std::shared_ptr<const CancellationToken> token, uint64_t id)
            : token_(std::move(token)), id_(id) {}

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        Registration(Registration&& other) noexcept
            : token_(std::move(other.token_)), id_(other.id_) {}

        Registration& operator=(Registration&& other) noexcept {
            if (this != &other) {
                reset();
                token_ = std::move(other.token_);
                id_ = other.id_;
            }
            return *this;
        }

        ~Registration() { reset(); }

        void reset() {
            if (token_) {
                token_->removeCallback(id_);
                token_.reset();
            }
        }

    private:
        std::shared_ptr<const CancellationToken> token_;
        uint64_t id_ = 0;
    };

    /**
     * @brief Зарегистрировать обработчик отмены
     *
     * Обработчик вызывается один раз из потока, вызвавшего cancel().
     * Если токен уже отменён, вызывается сразу. Обработчик не должен
     * обращаться к этому же токену.
     */
    static Registration onCancel(const std::shared_ptr<const CancellationToken>& token, Callback callback) {
        std::lock_guard<std::mutex> lock(token->callbacksMutex_);
        if (token->cancelled_.load(std::memory_order_acquire)) {
            callback();
            return Registration();
        }
        uint64_t id = ++token->nextCallbackId_;
        token->callbacks_.emplace(id, std::move(callback));
        return Registration(token, id);
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& [id, callback] : callbacks) {
            callback();
        }
    }

    bool isCancelled() const {
        if (cancelled_.load(std::memory_order_acquire)) return true;
        return deadline_ && Clock::now() >= *deadline_;
    }

    /**
     * @throws CancelledError если отменено или дедлайн прошёл
     */
    void throwIfCancelled() const {
        if (cancelled_.load(std::memory_order_acquire)) {
            throw CancelledError("operation cancelled");
        }
        if (deadline_ && Clock::now() >= *deadline_) {
            throw CancelledError("deadline exceeded");
        }
    }

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    /**
     * @brief Сколько осталось до дедлайна (nullopt - дедлайна нет)
     */
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline_) return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;

    mutable std::mutex callbacksMutex_;
    mutable std::map<uint64_t, Callback> callbacks_;
    mutable uint64_t nextCallbackId_ = 0;

    void removeCallback(uint64_t id) const {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks_.erase(id);
    }
};

} // namespace bank::domain
