#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "action_sink.hpp"
#include "database_mock.hpp"
#include "ledger.hpp"
#include "test_utils.hpp"

using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

TEST(DatabaseActionSink, AppendsEveryAction)
{
    StrictMock<DatabaseMock> db;
    {
        InSequence seq;
        EXPECT_CALL(db, appendAction(Field(&Action::label, "created")))
            .WillOnce(Return(mw::E<void>()));
        EXPECT_CALL(db, appendAction(Field(&Action::label, "upvote")))
            .WillOnce(Return(mw::E<void>()));
    }

    Ledger ledger(100);
    ledger.addSink(std::make_unique<DatabaseActionSink>(db));
    ASSIGN_OR_FAIL(ItemID p1, ledger.createPost(1, "hello"));
    ASSERT_TRUE(ledger.vote(2, ContentKind::POST, p1, true));
    // Rejected: nothing is appended.
    EXPECT_FALSE(ledger.vote(2, ContentKind::POST, p1, true));
}

TEST(DatabaseActionSink, PropagatesDatabaseErrors)
{
    StrictMock<DatabaseMock> db;
    EXPECT_CALL(db, appendAction(_))
        .WillOnce(Return(mw::E<void>(
            std::unexpected(mw::runtimeError("disk full")))));
    DatabaseActionSink sink(db);
    auto res = sink.publish(Action{});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(mw::errorMsg(res.error()), "disk full");
}

TEST(LogActionSink, AlwaysSucceeds)
{
    LogActionSink sink;
    EXPECT_TRUE(sink.publish(Action{1, Action::VOTE_ACTION, 3, 2, 1, "upvote",
                                    12}));
}
