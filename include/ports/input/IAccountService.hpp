#pragma once

#include "domain/Account.hpp"
#include "domain/Entry.hpp"
#include "domain/Transfer.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace bank::ports::input {

struct CreateAccountRequest {
    std::string owner;
    int64_t balance = 0;
    std::string currency = "USD";
};

/**
 * @brief Интерфейс сервиса счетов (заведение и просмотр)
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    virtual domain::Account createAccount(const CreateAccountRequest& request) = 0;
    virtual domain::Account getAccount(int64_t id) = 0;
    virtual std::vector<domain::Entry> getEntries(int64_t accountId) = 0;
    virtual domain::Transfer getTransfer(int64_t id) = 0;
};

} // namespace bank::ports::input
