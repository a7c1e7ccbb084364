#pragma once

#include "domain/Account.hpp"
#include "domain/Entry.hpp"
#include "domain/Transfer.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace bank::ports::output {

struct CreateAccountParams {
    std::string owner;
    int64_t balance = 0;
    std::string currency = "USD";
};

struct CreateTransferParams {
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;
    int64_t amount = 0;
};

struct CreateEntryParams {
    int64_t accountId = 0;
    int64_t amount = 0;
};

struct UpdateAccountParams {
    int64_t id = 0;
    int64_t balance = 0;
};

/**
 * @brief Набор одиночных запросов к таблицам accounts / entries / transfers
 *
 * Каждый метод - ровно один SQL-оператор. Выполняется в том контексте,
 * из которого получен объект:
 * - IStore::queries()       - без транзакции, каждый оператор коммитится сам
 * - ITransaction::queries() - внутри транзакции, изменения не видны до COMMIT
 *
 * Ошибки хранилища пробрасываются исключениями из domain/errors/TransferErrors.hpp.
 */
class IQueries {
public:
    virtual ~IQueries() = default;

    virtual domain::Account createAccount(const CreateAccountParams& params) = 0;

    /**
     * @throws domain::NotFoundError если счёта нет
     */
    virtual domain::Account getAccount(int64_t id) = 0;

    /**
     * @brief Прочитать счёт и взять блокировку строки до конца транзакции
     *
     * SELECT ... FOR NO KEY UPDATE: конкурентный перевод по тому же счёту
     * ждёт COMMIT/ROLLBACK, поэтому read-modify-write баланса не теряет обновлений.
     *
     * @throws domain::NotFoundError если счёта нет
     */
    virtual domain::Account getAccountForUpdate(int64_t id) = 0;

    /**
     * @throws domain::NotFoundError если счёта нет
     */
    virtual domain::Account updateAccount(const UpdateAccountParams& params) = 0;

    /**
     * @throws domain::NotFoundError если одного из счетов нет
     */
    virtual domain::Transfer createTransfer(const CreateTransferParams& params) = 0;

    /**
     * @throws domain::NotFoundError если перевода нет
     */
    virtual domain::Transfer getTransfer(int64_t id) = 0;

    /**
     * @throws domain::NotFoundError если счёта нет
     */
    virtual domain::Entry createEntry(const CreateEntryParams& params) = 0;

    virtual std::vector<domain::Entry> listEntries(int64_t accountId) = 0;
};

} // namespace bank::ports::output
