#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace bank::domain {

/**
 * @brief Счёт в журнале
 *
 * Баланс хранится в минорных единицах валюты (центы, копейки).
 * Меняется только через updateAccount, переводом не удаляется.
 */
struct Account {
    int64_t id = 0;
    std::string owner;
    int64_t balance = 0;         ///< Может быть отрицательным
    std::string currency = "USD";
    Timestamp createdAt;
};

} // namespace bank::domain
