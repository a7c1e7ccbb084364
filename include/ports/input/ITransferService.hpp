// include/ports/input/ITransferService.hpp
#pragma once

#include "domain/TransferRequest.hpp"
#include "domain/TransferResult.hpp"
#include "domain/TxOptions.hpp"

namespace bank::ports::input {

/**
 * @brief Интерфейс сервиса переводов
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Перевести деньги между двумя счетами одной транзакцией
     *
     * Создаёт запись перевода, две проводки и обновляет оба баланса.
     *
     * @throws domain::ValidationError amount <= 0 или fromAccountId == toAccountId
     * @throws domain::NotFoundError   счёта нет
     * @throws domain::ConflictError   serialization failure / deadlock, можно повторить
     * @throws domain::RollbackError   ошибка операции и ошибка отката
     * @throws domain::CommitError     сбой COMMIT
     * @throws domain::CancelledError  отмена или дедлайн
     */
    virtual domain::TransferResult transferMoney(
        const domain::TransferRequest& request,
        const domain::TxOptions& options = {}) = 0;
};

} // namespace bank::ports::input
