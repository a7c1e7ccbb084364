#pragma once

#include <cstdint>

namespace bank::domain {

/**
 * @brief Запрос на перевод
 *
 * Допустим только при amount > 0 и fromAccountId != toAccountId.
 */
struct TransferRequest {
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;
    int64_t amount = 0;
};

} // namespace bank::domain
