#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IStore.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Сервис счетов: одиночные запросы без транзакции
 */
class AccountService : public ports::input::IAccountService {
public:
    explicit AccountService(std::shared_ptr<ports::output::IStore> store)
        : store_(std::move(store))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account createAccount(const ports::input::CreateAccountRequest& request) override {
        if (request.owner.empty()) {
            throw domain::ValidationError("owner is required");
        }
        if (request.currency.empty()) {
            throw domain::ValidationError("currency is required");
        }

        auto account = store_->queries()->createAccount({
            .owner = request.owner,
            .balance = request.balance,
            .currency = request.currency
        });

        std::cout << "[AccountService] Created account " << account.id
                  << " owner=" << account.owner << std::endl;
        return account;
    }

    domain::Account getAccount(int64_t id) override {
        return store_->queries()->getAccount(id);
    }

    std::vector<domain::Entry> getEntries(int64_t accountId) override {
        // Неизвестный счёт → NotFoundError, а не пустой список
        store_->queries()->getAccount(accountId);
        return store_->queries()->listEntries(accountId);
    }

    domain::Transfer getTransfer(int64_t id) override {
        return store_->queries()->getTransfer(id);
    }

private:
    std::shared_ptr<ports::output::IStore> store_;
};

} // namespace bank::application
