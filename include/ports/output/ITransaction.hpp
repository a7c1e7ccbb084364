#pragma once

#include "IQueries.hpp"

namespace bank::ports::output {

/**
 * @brief Открытая транзакция хранилища
 *
 * Принадлежит ровно одной единице работы, между потоками не передаётся.
 * Если объект разрушен без commit()/rollback(), реализация откатывает транзакцию.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    /**
     * @brief Запросы, привязанные к этой транзакции
     */
    virtual IQueries& queries() = 0;

    virtual void commit() = 0;

    virtual void rollback() = 0;
};

} // namespace bank::ports::output
