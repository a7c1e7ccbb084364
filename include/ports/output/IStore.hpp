#pragma once

#include "IQueries.hpp"
#include "ITransaction.hpp"
#include "domain/TxOptions.hpp"
#include <memory>

namespace bank::ports::output {

/**
 * @brief Хранилище: одиночные запросы и транзакции
 */
class IStore {
public:
    virtual ~IStore() = default;

    /**
     * @brief Запросы без транзакции (autocommit)
     */
    virtual std::shared_ptr<IQueries> queries() = 0;

    /**
     * @brief Начать транзакцию на собственном соединении
     *
     * Уровень изоляции и таймаут берутся из options; если isolation не задан -
     * используется уровень хранилища по умолчанию.
     */
    virtual std::unique_ptr<ITransaction> begin(const domain::TxOptions& options) = 0;
};

} // namespace bank::ports::output
