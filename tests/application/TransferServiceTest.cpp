#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/TransferService.hpp"
#include "mocks/InMemoryStore.hpp"
#include "mocks/FaultyStore.hpp"
#include "mocks/MockStore.hpp"
#include "mocks/StaticTransactionSettings.hpp"
#include <limits>
#include <string>
#include <vector>

using namespace bank;
using namespace bank::tests::mocks;
using ::testing::_;
using ::testing::ByMove;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;

class TransferServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryStore>();
        service_ = makeService(store_);

        accountA_ = store_->seedAccount("alice", 100);
        accountB_ = store_->seedAccount("bob", 50);
    }

    static std::shared_ptr<application::TransferService> makeService(std::shared_ptr<ports::output::IStore> store) {
        auto executor = std::make_shared<application::TransactionExecutor>(
            std::move(store), std::make_shared<StaticTransactionSettings>());
        return std::make_shared<application::TransferService>(executor);
    }

    domain::TransferRequest request(int64_t from, int64_t to, int64_t amount) {
        return domain::TransferRequest{.fromAccountId = from, .toAccountId = to, .amount = amount};
    }

    void expectUnchanged() {
        EXPECT_EQ(store_->balanceOf(accountA_.id), 100);
        EXPECT_EQ(store_->balanceOf(accountB_.id), 50);
        EXPECT_EQ(store_->entryCount(), 0);
        EXPECT_EQ(store_->transferCount(), 0);
    }

    std::shared_ptr<InMemoryStore> store_;
    std::shared_ptr<application::TransferService> service_;
    domain::Account accountA_;
    domain::Account accountB_;
};

// ============================================
// УСПЕШНЫЙ ПЕРЕВОД
// ============================================

TEST_F(TransferServiceTest, Transfer_A100_B50_Moves30) {
    auto result = service_->transferMoney(request(accountA_.id, accountB_.id, 30));

    EXPECT_GT(result.transfer.id, 0);
    EXPECT_EQ(result.transfer.fromAccountId, accountA_.id);
    EXPECT_EQ(result.transfer.toAccountId, accountB_.id);
    EXPECT_EQ(result.transfer.amount, 30);

    EXPECT_EQ(result.fromAccount.id, accountA_.id);
    EXPECT_EQ(result.fromAccount.balance, 70);
    EXPECT_EQ(result.toAccount.id, accountB_.id);
    EXPECT_EQ(result.toAccount.balance, 80);

    EXPECT_EQ(result.fromEntry.accountId, accountA_.id);
    EXPECT_EQ(result.fromEntry.amount, -30);
    EXPECT_EQ(result.toEntry.accountId, accountB_.id);
    EXPECT_EQ(result.toEntry.amount, 30);

    EXPECT_EQ(store_->balanceOf(accountA_.id), 70);
    EXPECT_EQ(store_->balanceOf(accountB_.id), 80);
}

TEST_F(TransferServiceTest, Transfer_EntriesSumToZeroAndArePersisted) {
    auto result = service_->transferMoney(request(accountA_.id, accountB_.id, 17));

    EXPECT_EQ(result.fromEntry.amount + result.toEntry.amount, 0);

    auto entriesA = store_->entriesFor(accountA_.id);
    auto entriesB = store_->entriesFor(accountB_.id);
    ASSERT_EQ(entriesA.size(), 1);
    ASSERT_EQ(entriesB.size(), 1);
    EXPECT_EQ(entriesA[0].id, result.fromEntry.id);
    EXPECT_EQ(entriesB[0].id, result.toEntry.id);
    EXPECT_EQ(store_->queries()->getTransfer(result.transfer.id).amount, 17);
}

TEST_F(TransferServiceTest, Transfer_HigherToLowerId_MapsAccountsToRequestRoles) {
    // B имеет больший id: обновляется сначала получатель, но роли в результате не меняются
    auto result = service_->transferMoney(request(accountB_.id, accountA_.id, 20));

    EXPECT_EQ(result.fromAccount.id, accountB_.id);
    EXPECT_EQ(result.fromAccount.balance, 30);
    EXPECT_EQ(result.toAccount.id, accountA_.id);
    EXPECT_EQ(result.toAccount.balance, 120);
    EXPECT_EQ(result.fromEntry.accountId, accountB_.id);
    EXPECT_EQ(result.fromEntry.amount, -20);
}

TEST_F(TransferServiceTest, Transfer_BalanceMayGoNegative) {
    auto result = service_->transferMoney(request(accountB_.id, accountA_.id, 80));

    EXPECT_EQ(result.fromAccount.balance, -30);
    EXPECT_EQ(result.toAccount.balance, 180);
}

TEST_F(TransferServiceTest, Transfer_SequentialTransfers_Accumulate) {
    for (int i = 0; i < 5; ++i) {
        service_->transferMoney(request(accountA_.id, accountB_.id, 10));
    }

    EXPECT_EQ(store_->balanceOf(accountA_.id), 50);
    EXPECT_EQ(store_->balanceOf(accountB_.id), 100);
    EXPECT_EQ(store_->entryCount(), 10);
    EXPECT_EQ(store_->transferCount(), 5);
}

TEST_F(TransferServiceTest, Transfer_WithLabel_TracesEachStepInOrder) {
    domain::TxOptions options;
    options.label = "tx 1";

    testing::internal::CaptureStdout();
    auto result = service_->transferMoney(request(accountA_.id, accountB_.id, 5), options);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(result.fromAccount.balance, 95);
    EXPECT_EQ(result.toAccount.balance, 55);

    std::string a = std::to_string(accountA_.id);
    std::string b = std::to_string(accountB_.id);
    std::vector<std::string> steps = {
        "[TransferService] tx 1 create transfer",
        "[TransferService] tx 1 create entry 1",
        "[TransferService] tx 1 create entry 2",
        "[TransferService] tx 1 get account " + a,
        "[TransferService] tx 1 update account " + a,
        "[TransferService] tx 1 get account " + b,
        "[TransferService] tx 1 update account " + b,
    };
    size_t position = 0;
    for (const auto& step : steps) {
        auto found = output.find(step, position);
        ASSERT_NE(found, std::string::npos) << "missing step: " << step << "\n" << output;
        position = found + step.size();
    }
}

TEST_F(TransferServiceTest, Transfer_WithoutLabel_NoStepTrace) {
    testing::internal::CaptureStdout();
    service_->transferMoney(request(accountA_.id, accountB_.id, 5));
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(output.find("create entry"), std::string::npos);
}

// ============================================
// ВАЛИДАЦИЯ
// ============================================

TEST_F(TransferServiceTest, Transfer_NegativeAmount_RejectedBeforeAnyWrite) {
    EXPECT_THROW(service_->transferMoney(request(accountA_.id, accountB_.id, -5)), domain::ValidationError);

    EXPECT_EQ(store_->beginCount(), 0);
    expectUnchanged();
}

TEST_F(TransferServiceTest, Transfer_ZeroAmount_Rejected) {
    EXPECT_THROW(service_->transferMoney(request(accountA_.id, accountB_.id, 0)), domain::ValidationError);
    EXPECT_EQ(store_->beginCount(), 0);
}

TEST_F(TransferServiceTest, Transfer_SameAccount_Rejected) {
    EXPECT_THROW(service_->transferMoney(request(accountA_.id, accountA_.id, 10)), domain::ValidationError);

    EXPECT_EQ(store_->beginCount(), 0);
    expectUnchanged();
}

TEST_F(TransferServiceTest, Transfer_UnknownDestination_NotFoundAndNothingWritten) {
    EXPECT_THROW(service_->transferMoney(request(accountA_.id, 9999, 10)), domain::NotFoundError);

    EXPECT_EQ(store_->rollbackCount(), 1);
    expectUnchanged();
}

TEST_F(TransferServiceTest, Transfer_BalanceOverflow_RejectedAndRolledBack) {
    auto rich = store_->seedAccount("rich", std::numeric_limits<int64_t>::max() - 5);

    EXPECT_THROW(service_->transferMoney(request(accountA_.id, rich.id, 10)), domain::ValidationError);

    EXPECT_EQ(store_->balanceOf(accountA_.id), 100);
    EXPECT_EQ(store_->balanceOf(rich.id), std::numeric_limits<int64_t>::max() - 5);
    EXPECT_EQ(store_->entryCount(), 0);
}

// ============================================
// АТОМАРНОСТЬ: отказ на любом шаге
// ============================================

TEST_F(TransferServiceTest, Transfer_FailureOnThirdWrite_LeavesStateUnchanged) {
    // Третья запись - проводка зачисления на счёт получателя
    auto faulty = std::make_shared<FaultyStore>(store_, 3);
    auto service = makeService(faulty);

    EXPECT_THROW(service->transferMoney(request(accountA_.id, accountB_.id, 30)), std::runtime_error);

    expectUnchanged();
    EXPECT_EQ(store_->rollbackCount(), 1);
    EXPECT_EQ(store_->commitCount(), 0);
}

TEST_F(TransferServiceTest, Transfer_FailureOnAnyWrite_LeavesStateUnchanged) {
    // 1 - transfer, 2 и 3 - проводки, 4 и 5 - балансы
    for (int failOn = 1; failOn <= 5; ++failOn) {
        auto faulty = std::make_shared<FaultyStore>(store_, failOn);
        auto service = makeService(faulty);

        EXPECT_THROW(service->transferMoney(request(accountA_.id, accountB_.id, 30)), std::runtime_error)
            << "write #" << failOn;
        expectUnchanged();
    }
    EXPECT_EQ(store_->rollbackCount(), 5);
}

TEST_F(TransferServiceTest, Transfer_AfterFailedAttempt_LocksReleased) {
    auto faulty = std::make_shared<FaultyStore>(store_, 5);
    EXPECT_THROW(makeService(faulty)->transferMoney(request(accountA_.id, accountB_.id, 30)), std::runtime_error);

    // Блокировки строк сняты откатом, следующий перевод проходит
    auto result = service_->transferMoney(request(accountA_.id, accountB_.id, 30));
    EXPECT_EQ(result.fromAccount.balance, 70);
    EXPECT_EQ(store_->lockTimeouts(), 0);
}

// ============================================
// ПОРЯДОК ШАГОВ И БЛОКИРОВОК (gmock)
// ============================================

class TransferServiceOrderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MockStore>();
        service_ = std::make_shared<application::TransferService>(
            std::make_shared<application::TransactionExecutor>(store_, std::make_shared<StaticTransactionSettings>()));

        auto tx = std::make_unique<NiceMock<MockTransaction>>();
        ON_CALL(*tx, queries()).WillByDefault(ReturnRef(queries_));
        EXPECT_CALL(*tx, commit()).Times(1);
        std::unique_ptr<ports::output::ITransaction> owned = std::move(tx);
        EXPECT_CALL(*store_, begin(_)).WillOnce(Return(ByMove(std::move(owned))));

        ON_CALL(queries_, createTransfer(_)).WillByDefault(Invoke([](const ports::output::CreateTransferParams& p) {
            return domain::Transfer{.id = 1, .fromAccountId = p.fromAccountId, .toAccountId = p.toAccountId, .amount = p.amount};
        }));
        ON_CALL(queries_, createEntry(_)).WillByDefault(Invoke([](const ports::output::CreateEntryParams& p) {
            return domain::Entry{.id = p.accountId, .accountId = p.accountId, .amount = p.amount};
        }));
        ON_CALL(queries_, getAccountForUpdate(_)).WillByDefault(Invoke([](int64_t id) {
            return domain::Account{.id = id, .owner = "o", .balance = 100};
        }));
        ON_CALL(queries_, updateAccount(_)).WillByDefault(Invoke([](const ports::output::UpdateAccountParams& p) {
            return domain::Account{.id = p.id, .owner = "o", .balance = p.balance};
        }));
    }

    std::shared_ptr<MockStore> store_;
    std::shared_ptr<application::TransferService> service_;
    NiceMock<MockQueries> queries_;
};

TEST_F(TransferServiceOrderTest, LowerToHigher_SourceLockedFirst) {
    {
        InSequence seq;
        EXPECT_CALL(queries_, createTransfer(_));
        EXPECT_CALL(queries_, createEntry(::testing::Field(&ports::output::CreateEntryParams::amount, -25)));
        EXPECT_CALL(queries_, createEntry(::testing::Field(&ports::output::CreateEntryParams::amount, 25)));
        EXPECT_CALL(queries_, getAccountForUpdate(1));
        EXPECT_CALL(queries_, updateAccount(::testing::Field(&ports::output::UpdateAccountParams::id, 1)));
        EXPECT_CALL(queries_, getAccountForUpdate(2));
        EXPECT_CALL(queries_, updateAccount(::testing::Field(&ports::output::UpdateAccountParams::id, 2)));
    }

    auto result = service_->transferMoney({.fromAccountId = 1, .toAccountId = 2, .amount = 25});

    EXPECT_EQ(result.fromAccount.balance, 75);
    EXPECT_EQ(result.toAccount.balance, 125);
}

TEST_F(TransferServiceOrderTest, HigherToLower_DestinationLockedFirst) {
    {
        InSequence seq;
        EXPECT_CALL(queries_, createTransfer(_));
        EXPECT_CALL(queries_, createEntry(::testing::Field(&ports::output::CreateEntryParams::accountId, 2)));
        EXPECT_CALL(queries_, createEntry(::testing::Field(&ports::output::CreateEntryParams::accountId, 1)));
        EXPECT_CALL(queries_, getAccountForUpdate(1));
        EXPECT_CALL(queries_, updateAccount(::testing::Field(&ports::output::UpdateAccountParams::balance, 125)));
        EXPECT_CALL(queries_, getAccountForUpdate(2));
        EXPECT_CALL(queries_, updateAccount(::testing::Field(&ports::output::UpdateAccountParams::balance, 75)));
    }

    auto result = service_->transferMoney({.fromAccountId = 2, .toAccountId = 1, .amount = 25});

    EXPECT_EQ(result.fromAccount.id, 2);
    EXPECT_EQ(result.fromAccount.balance, 75);
    EXPECT_EQ(result.toAccount.id, 1);
    EXPECT_EQ(result.toAccount.balance, 125);
}
