#pragma once

#include "Account.hpp"
#include "Entry.hpp"
#include "Transfer.hpp"

namespace bank::domain {

/**
 * @brief Результат перевода
 *
 * Заполняется целиком или не возвращается вовсе (исключение).
 * Счета - в состоянии после обновления баланса.
 */
struct TransferResult {
    Transfer transfer;
    Account fromAccount;
    Account toAccount;
    Entry fromEntry;             ///< Списание с fromAccount (-amount)
    Entry toEntry;               ///< Зачисление на toAccount (+amount)
};

} // namespace bank::domain
