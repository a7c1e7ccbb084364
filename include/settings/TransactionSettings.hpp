// include/settings/TransactionSettings.hpp
#pragma once

#include "ITransactionSettings.hpp"
#include <cstdlib>
#include <string>

namespace bank::settings
{

    /**
     * @brief Настройки транзакций
     *
     * Читает из ENV:
     * - BANK_TX_ISOLATION (default: READ_COMMITTED)
     * - BANK_TX_TIMEOUT_MS (default: 0 - без statement_timeout)
     * - BANK_DB_INIT_SCHEMA (default: true)
     *
     * Стратегия по умолчанию: READ COMMITTED + блокировка строки при чтении баланса.
     * SERIALIZABLE включается здесь или через TxOptions; тогда ConflictError
     * повторяет вызывающий.
     */
    class TransactionSettings : public ITransactionSettings
    {
    public:
        TransactionSettings()
        {
            if (const char *val = std::getenv("BANK_TX_ISOLATION"))
            {
                isolation_ = domain::parseIsolationLevel(val);
            }
            if (const char *val = std::getenv("BANK_TX_TIMEOUT_MS"))
            {
                timeout_ = std::chrono::milliseconds(std::stol(val));
            }
            if (const char *val = std::getenv("BANK_DB_INIT_SCHEMA"))
            {
                std::string flag(val);
                initSchema_ = !(flag == "0" || flag == "false" || flag == "FALSE");
            }
        }

        domain::IsolationLevel getDefaultIsolation() const override { return isolation_; }
        std::chrono::milliseconds getStatementTimeout() const override { return timeout_; }
        bool shouldInitSchema() const override { return initSchema_; }

    private:
        domain::IsolationLevel isolation_ = domain::IsolationLevel::READ_COMMITTED;
        std::chrono::milliseconds timeout_{0};
        bool initSchema_ = true;
    };

} // namespace bank::settings
