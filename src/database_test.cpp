#include <filesystem>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "database.hpp"
#include "test_utils.hpp"

class DatabaseTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        db_path = "test_karma.db";
        if(std::filesystem::exists(db_path))
        {
            std::filesystem::remove(db_path);
        }
        db = std::make_unique<Database>(db_path);
        auto res = db->init();
        if(!res)
        {
            FAIL() << "Failed to init database: " << mw::errorMsg(res.error());
        }
    }

    void TearDown() override
    {
        db.reset();
        for(const char* suffix : {"", "-wal", "-shm"})
        {
            std::filesystem::remove(db_path + suffix);
        }
    }

    std::string db_path;
    std::unique_ptr<Database> db;
};

TEST_F(DatabaseTest, EmptyLog)
{
    ASSIGN_OR_FAIL(uint64_t seq, db->lastActionSeq());
    EXPECT_EQ(seq, 0);
    ASSIGN_OR_FAIL(auto actions, db->getActions(0, 10));
    EXPECT_TRUE(actions.empty());
}

TEST_F(DatabaseTest, AppendAndRead)
{
    Action a{1, Action::POST_ACTION, 1, 7, 7, "created", 10};
    Action b{2, Action::VOTE_ACTION, 1, 8, 7, "upvote", 12};
    Action c{3, Action::MODERATOR_CHANGED, 0, 100, 8, "granted", 0};
    ASSERT_TRUE(db->appendAction(a));
    ASSERT_TRUE(db->appendAction(b));
    ASSERT_TRUE(db->appendAction(c));

    ASSIGN_OR_FAIL(uint64_t seq, db->lastActionSeq());
    EXPECT_EQ(seq, 3);

    ASSIGN_OR_FAIL(auto actions, db->getActions(0, 10));
    ASSERT_EQ(actions.size(), 3);
    EXPECT_EQ(actions[0], a);
    EXPECT_EQ(actions[1], b);
    EXPECT_EQ(actions[2], c);

    ASSIGN_OR_FAIL(actions, db->getActions(1, 1));
    ASSERT_EQ(actions.size(), 1);
    EXPECT_EQ(actions[0], b);
}

TEST_F(DatabaseTest, LargeIdentitiesSurvive)
{
    Action a{1, Action::VOTE_ACTION, 5, UINT64_MAX, UINT64_MAX - 1, "downvote",
             MIN_REP};
    ASSERT_TRUE(db->appendAction(a));
    ASSIGN_OR_FAIL(auto actions, db->getActions(0, 1));
    ASSERT_EQ(actions.size(), 1);
    EXPECT_EQ(actions[0], a);
}

TEST_F(DatabaseTest, DuplicateSeqFails)
{
    Action a{1, Action::POST_ACTION, 1, 7, 7, "created", 10};
    ASSERT_TRUE(db->appendAction(a));
    EXPECT_FALSE(db->appendAction(a));
}

TEST_F(DatabaseTest, ReopenKeepsLog)
{
    ASSERT_TRUE(db->appendAction({1, Action::POST_ACTION, 1, 7, 7, "created",
                                  10}));
    db = std::make_unique<Database>(db_path);
    ASSERT_TRUE(db->init());
    ASSIGN_OR_FAIL(uint64_t seq, db->lastActionSeq());
    EXPECT_EQ(seq, 1);
}
