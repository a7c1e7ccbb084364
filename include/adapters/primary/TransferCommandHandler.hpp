// include/adapters/primary/TransferCommandHandler.hpp
#pragma once

#include "ports/input/ITransferService.hpp"
#include "ports/input/IAccountService.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace bank::adapters::primary {

/**
 * @brief Ответ на команду: код в духе HTTP и JSON-тело
 */
struct CommandResponse {
    int status = 200;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Обработчик JSON-команд
 *
 * Команды (поле "command", по умолчанию "transfer"):
 * - transfer:       {"from_account_id": 1, "to_account_id": 2, "amount": 30,
 *                    "isolation": "SERIALIZABLE", "timeout_ms": 500, "label": "tx 1"}
 * - create_account: {"owner": "alice", "balance": 100, "currency": "USD"}
 * - get_account:    {"id": 1}
 * - list_entries:   {"account_id": 1}
 * - get_transfer:   {"id": 1}
 *
 * Коды ошибок: 400 ValidationError, 404 NotFoundError, 408 CancelledError,
 * 409 ConflictError (retryable=true), 500 CommitError / RollbackError / прочее.
 */
class TransferCommandHandler {
public:
    TransferCommandHandler(
        std::shared_ptr<ports::input::ITransferService> transferService,
        std::shared_ptr<ports::input::IAccountService> accountService
    ) : transferService_(std::move(transferService))
      , accountService_(std::move(accountService))
    {
        std::cout << "[TransferCommandHandler] Created" << std::endl;
    }

    CommandResponse handle(const std::string& body) {
        try {
            auto request = nlohmann::json::parse(body);
            if (!request.is_object()) {
                return error(400, "Request must be a JSON object", false);
            }

            std::string command = request.value("command", "transfer");

            if (command == "transfer") {
                return handleTransfer(request);
            }
            if (command == "create_account") {
                return handleCreateAccount(request);
            }
            if (command == "get_account") {
                return respond(200, accountToJson(accountService_->getAccount(requireId(request, "id"))));
            }
            if (command == "list_entries") {
                nlohmann::json entries = nlohmann::json::array();
                for (const auto& entry : accountService_->getEntries(requireId(request, "account_id"))) {
                    entries.push_back(entryToJson(entry));
                }
                return respond(200, entries);
            }
            if (command == "get_transfer") {
                return respond(200, transferToJson(accountService_->getTransfer(requireId(request, "id"))));
            }
            return error(400, "Unknown command: " + command, false);
        }
        catch (const nlohmann::json::exception& e) {
            return error(400, std::string("Invalid JSON: ") + e.what(), false);
        }
        catch (const domain::ValidationError& e) {
            return fail(400, e);
        }
        catch (const domain::NotFoundError& e) {
            return fail(404, e);
        }
        catch (const domain::CancelledError& e) {
            return fail(408, e);
        }
        catch (const domain::ConflictError& e) {
            return fail(409, e);
        }
        catch (const std::exception& e) {
            std::cerr << "[TransferCommandHandler] Error: " << e.what() << std::endl;
            return fail(500, e);
        }
    }

    static nlohmann::json accountToJson(const domain::Account& account) {
        return {
            {"id", account.id},
            {"owner", account.owner},
            {"balance", account.balance},
            {"currency", account.currency},
            {"created_at", account.createdAt.toString()}
        };
    }

    static nlohmann::json entryToJson(const domain::Entry& entry) {
        return {
            {"id", entry.id},
            {"account_id", entry.accountId},
            {"amount", entry.amount},
            {"created_at", entry.createdAt.toString()}
        };
    }

    static nlohmann::json transferToJson(const domain::Transfer& transfer) {
        return {
            {"id", transfer.id},
            {"from_account_id", transfer.fromAccountId},
            {"to_account_id", transfer.toAccountId},
            {"amount", transfer.amount},
            {"created_at", transfer.createdAt.toString()}
        };
    }

    static nlohmann::json resultToJson(const domain::TransferResult& result) {
        return {
            {"transfer", transferToJson(result.transfer)},
            {"from_account", accountToJson(result.fromAccount)},
            {"to_account", accountToJson(result.toAccount)},
            {"from_entry", entryToJson(result.fromEntry)},
            {"to_entry", entryToJson(result.toEntry)}
        };
    }

private:
    std::shared_ptr<ports::input::ITransferService> transferService_;
    std::shared_ptr<ports::input::IAccountService> accountService_;

    CommandResponse handleTransfer(const nlohmann::json& request) {
        domain::TransferRequest transfer;
        transfer.fromAccountId = requireId(request, "from_account_id");
        transfer.toAccountId = requireId(request, "to_account_id");
        transfer.amount = requireInt(request, "amount");

        domain::TxOptions options;
        if (request.contains("isolation")) {
            try {
                options.isolation = domain::parseIsolationLevel(request.at("isolation").get<std::string>());
            } catch (const std::invalid_argument& e) {
                return error(400, e.what(), false);
            }
        }
        if (request.contains("timeout_ms")) {
            auto timeoutMs = requireInt(request, "timeout_ms");
            if (timeoutMs <= 0) {
                return error(400, "timeout_ms must be positive", false);
            }
            options.cancellation = domain::CancellationToken::withTimeout(std::chrono::milliseconds(timeoutMs));
        }
        options.label = request.value("label", "");

        auto result = transferService_->transferMoney(transfer, options);
        return respond(201, resultToJson(result));
    }

    CommandResponse handleCreateAccount(const nlohmann::json& request) {
        ports::input::CreateAccountRequest create;
        create.owner = request.value("owner", "");
        create.currency = request.value("currency", "USD");
        create.balance = request.contains("balance") ? requireInt(request, "balance") : 0;

        return respond(201, accountToJson(accountService_->createAccount(create)));
    }

    static int64_t requireInt(const nlohmann::json& request, const char* field) {
        if (!request.contains(field) || !request.at(field).is_number_integer()) {
            throw domain::ValidationError(std::string(field) + " must be an integer");
        }
        return request.at(field).get<int64_t>();
    }

    static int64_t requireId(const nlohmann::json& request, const char* field) {
        auto id = requireInt(request, field);
        if (id <= 0) {
            throw domain::ValidationError(std::string(field) + " must be positive");
        }
        return id;
    }

    static CommandResponse respond(int status, const nlohmann::json& body) {
        return CommandResponse{status, body.dump()};
    }

    static CommandResponse fail(int status, const std::exception& e) {
        return error(status, e.what(), domain::isRetryable(e));
    }

    static CommandResponse error(int status, const std::string& message, bool retryable) {
        nlohmann::json body;
        body["error"] = message;
        body["retryable"] = retryable;
        return CommandResponse{status, body.dump()};
    }
};

} // namespace bank::adapters::primary
