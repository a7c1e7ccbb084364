#pragma once

#include "domain/TransferRequest.hpp"
#include <array>
#include <cstdint>

namespace bank::application {

/**
 * @brief Изменение баланса одного счёта внутри перевода
 */
struct BalanceChange {
    int64_t accountId = 0;
    int64_t amount = 0;          ///< -amount для источника, +amount для получателя
};

/**
 * @brief Порядок обновления балансов в переводе
 *
 * Счёт с меньшим id обновляется первым. Два конкурентных перевода по одной
 * паре счетов (в любом направлении) берут блокировки строк в одном и том же
 * порядке, и циклического ожидания не возникает.
 *
 * Пример: A(1) → B(2) и B(2) → A(1) оба сначала блокируют счёт 1, затем 2.
 */
class LockOrdering {
public:
    static bool sourceFirst(const domain::TransferRequest& request) {
        return request.fromAccountId < request.toAccountId;
    }

    static std::array<BalanceChange, 2> order(const domain::TransferRequest& request) {
        BalanceChange debit{request.fromAccountId, -request.amount};
        BalanceChange credit{request.toAccountId, request.amount};
        if (sourceFirst(request)) {
            return {debit, credit};
        }
        return {credit, debit};
    }
};

} // namespace bank::application
