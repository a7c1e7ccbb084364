#pragma once

#include "Timestamp.hpp"
#include <cstdint>

namespace bank::domain {

/**
 * @brief Проводка по одному счёту
 *
 * amount < 0 - списание, amount > 0 - зачисление. После создания не меняется.
 */
struct Entry {
    int64_t id = 0;
    int64_t accountId = 0;
    int64_t amount = 0;
    Timestamp createdAt;
};

} // namespace bank::domain
