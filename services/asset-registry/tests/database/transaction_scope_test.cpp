/**
 * @file transaction_scope_test.cpp
 * @brief Commit/rollback behaviour of runInTransaction
 */

#include <gtest/gtest.h>
#include "transaction_scope.h"
#include "exceptions.h"
#include "fakes/recording_query_executor.h"

using test_fakes::RecordingQueryExecutor;

TEST(TransactionScopeTest, CommitsWhenWorkSucceeds) {
    RecordingQueryExecutor executor;

    bool committed = common::runInTransaction(executor, [](common::ITransaction& tx) {
        tx.executeCommand("INSERT INTO a VALUES ($1)", {"1"});
        tx.executeCommand("INSERT INTO b VALUES ($1)", {"2"});
        return true;
    });

    EXPECT_TRUE(committed);
    const auto& calls = executor.log().calls;
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0].kind, "begin");
    EXPECT_EQ(calls[1].kind, "command");
    EXPECT_EQ(calls[2].kind, "command");
    EXPECT_EQ(calls[3].kind, "commit");
}

TEST(TransactionScopeTest, RollsBackWhenWorkDeclines) {
    RecordingQueryExecutor executor;

    bool committed = common::runInTransaction(executor, [](common::ITransaction& tx) {
        return tx.executeCommand("INSERT INTO a VALUES ($1)", {"1"}) == 2;
    });

    EXPECT_FALSE(committed);
    EXPECT_EQ(executor.log().count("commit"), 0u);
    EXPECT_EQ(executor.log().count("rollback"), 1u);
}

TEST(TransactionScopeTest, RollsBackAndRethrowsOnFailure) {
    RecordingQueryExecutor executor;

    EXPECT_THROW(
        common::runInTransaction(executor, [](common::ITransaction& tx) -> bool {
            tx.executeCommand("INSERT INTO a VALUES ($1)", {"1"});
            throw common::TransactionStepException("second step wrote nothing");
        }),
        common::TransactionStepException);

    EXPECT_EQ(executor.log().count("commit"), 0u);
    EXPECT_EQ(executor.log().count("rollback"), 1u);
}

TEST(TransactionScopeTest, StorageErrorInsideWorkKeepsItsType) {
    RecordingQueryExecutor executor;
    executor.log().onStatement = [](const test_fakes::RecordedCall& call) {
        if (call.kind == "command") throw common::ConflictException("duplicate key");
    };

    EXPECT_THROW(
        common::runInTransaction(executor, [](common::ITransaction& tx) {
            tx.executeCommand("INSERT INTO a VALUES ($1)", {"1"});
            return true;
        }),
        common::ConflictException);
    EXPECT_EQ(executor.log().count("rollback"), 1u);
}
