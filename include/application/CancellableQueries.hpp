#pragma once

#include "ports/output/IQueries.hpp"
#include "domain/CancellationToken.hpp"
#include <memory>

namespace bank::application {

/**
 * @brief Декоратор IQueries: проверяет сигнал отмены перед каждым запросом
 *
 * Уже отправленный запрос ограничивается statement_timeout на стороне
 * хранилища, а следующий после отмены не выполняется вовсе.
 */
class CancellableQueries : public ports::output::IQueries {
public:
    CancellableQueries(ports::output::IQueries& delegate,
                       std::shared_ptr<const domain::CancellationToken> token)
        : delegate_(delegate)
        , token_(std::move(token))
    {}

    domain::Account createAccount(const ports::output::CreateAccountParams& params) override {
        token_->throwIfCancelled();
        return delegate_.createAccount(params);
    }

    domain::Account getAccount(int64_t id) override {
        token_->throwIfCancelled();
        return delegate_.getAccount(id);
    }

    domain::Account getAccountForUpdate(int64_t id) override {
        token_->throwIfCancelled();
        return delegate_.getAccountForUpdate(id);
    }

    domain::Account updateAccount(const ports::output::UpdateAccountParams& params) override {
        token_->throwIfCancelled();
        return delegate_.updateAccount(params);
    }

    domain::Transfer createTransfer(const ports::output::CreateTransferParams& params) override {
        token_->throwIfCancelled();
        return delegate_.createTransfer(params);
    }

    domain::Transfer getTransfer(int64_t id) override {
        token_->throwIfCancelled();
        return delegate_.getTransfer(id);
    }

    domain::Entry createEntry(const ports::output::CreateEntryParams& params) override {
        token_->throwIfCancelled();
        return delegate_.createEntry(params);
    }

    std::vector<domain::Entry> listEntries(int64_t accountId) override {
        token_->throwIfCancelled();
        return delegate_.listEntries(accountId);
    }

private:
    ports::output::IQueries& delegate_;
    std::shared_ptr<const domain::CancellationToken> token_;
};

} // namespace bank::application
