#pragma once

#include "domain/enums/IsolationLevel.hpp"
#include <chrono>

namespace bank::settings
{

    class ITransactionSettings
    {
    public:
        virtual ~ITransactionSettings() = default;

        virtual domain::IsolationLevel getDefaultIsolation() const = 0;

        /**
         * @brief statement_timeout по умолчанию; 0 - без ограничения
         */
        virtual std::chrono::milliseconds getStatementTimeout() const = 0;

        virtual bool shouldInitSchema() const = 0;
    };

} // namespace bank::settings
