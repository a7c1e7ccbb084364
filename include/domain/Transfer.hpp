#pragma once

#include "Timestamp.hpp"
#include <cstdint>

namespace bank::domain {

/**
 * @brief Запись о переводе между двумя счетами (неизменяемая)
 */
struct Transfer {
    int64_t id = 0;
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;
    int64_t amount = 0;          ///< Всегда > 0
    Timestamp createdAt;
};

} // namespace bank::domain
