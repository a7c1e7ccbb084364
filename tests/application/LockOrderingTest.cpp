#include <gtest/gtest.h>

#include "application/LockOrdering.hpp"

using namespace bank;
using bank::application::LockOrdering;

TEST(LockOrderingTest, LowerSourceId_DebitFirst) {
    auto changes = LockOrdering::order({.fromAccountId = 1, .toAccountId = 2, .amount = 30});

    EXPECT_TRUE(LockOrdering::sourceFirst({.fromAccountId = 1, .toAccountId = 2, .amount = 30}));
    EXPECT_EQ(changes[0].accountId, 1);
    EXPECT_EQ(changes[0].amount, -30);
    EXPECT_EQ(changes[1].accountId, 2);
    EXPECT_EQ(changes[1].amount, 30);
}

TEST(LockOrderingTest, HigherSourceId_CreditFirst) {
    auto changes = LockOrdering::order({.fromAccountId = 7, .toAccountId = 3, .amount = 5});

    EXPECT_FALSE(LockOrdering::sourceFirst({.fromAccountId = 7, .toAccountId = 3, .amount = 5}));
    EXPECT_EQ(changes[0].accountId, 3);
    EXPECT_EQ(changes[0].amount, 5);
    EXPECT_EQ(changes[1].accountId, 7);
    EXPECT_EQ(changes[1].amount, -5);
}

TEST(LockOrderingTest, OppositeDirections_SameLockOrder) {
    auto forward = LockOrdering::order({.fromAccountId = 10, .toAccountId = 20, .amount = 1});
    auto backward = LockOrdering::order({.fromAccountId = 20, .toAccountId = 10, .amount = 1});

    EXPECT_EQ(forward[0].accountId, backward[0].accountId);
    EXPECT_EQ(forward[1].accountId, backward[1].accountId);
}

TEST(LockOrderingTest, ChangesSumToZero) {
    auto changes = LockOrdering::order({.fromAccountId = 4, .toAccountId = 2, .amount = 99});
    EXPECT_EQ(changes[0].amount + changes[1].amount, 0);
}
