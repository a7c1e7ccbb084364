#pragma once

#include "CancellationToken.hpp"
#include "enums/IsolationLevel.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace bank::domain {

/**
 * @brief Параметры одной транзакции, задаются вызывающим на каждый запрос
 *
 * - isolation    - переопределение уровня изоляции (иначе берётся из TransactionSettings)
 * - timeout      - statement_timeout для всех запросов транзакции
 * - cancellation - сигнал отмены / дедлайн
 * - label        - метка для диагностического лога шагов ("tx 3"); пустая - без лога шагов
 */
struct TxOptions {
    std::optional<IsolationLevel> isolation;
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<CancellationToken> cancellation;
    std::string label;

    /**
     * @brief Эффективный таймаут запроса с учётом дедлайна токена
     */
    std::optional<std::chrono::milliseconds> effectiveTimeout() const {
        std::optional<std::chrono::milliseconds> result = timeout;
        if (cancellation) {
            if (auto left = cancellation->remaining()) {
                if (!result || *left < *result) {
                    result = *left;
                }
            }
        }
        return result;
    }
};

} // namespace bank::domain
