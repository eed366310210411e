#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// An already-authenticated caller. Zero is the anonymous identity and
// is never allowed to mutate the ledger.
using Identity = uint64_t;
constexpr Identity ANONYMOUS = 0;

using ItemID = uint64_t;

constexpr int64_t MIN_REP = -1'000'000;
constexpr int64_t MAX_REP = 1'000'000;

constexpr size_t MAX_POST_LEN = 10000;
constexpr size_t MAX_COMMENT_LEN = 5000;
constexpr size_t MAX_COMMENTS = 1000;
constexpr uint64_t MAX_BATCH = 100;

// Reputation deltas of each mutation.
constexpr int64_t REP_POST_CREATED = 10;
constexpr int64_t REP_COMMENT_CREATED = 5;
constexpr int64_t REP_UPVOTE_RECEIVED = 2;
constexpr int64_t REP_DOWNVOTE_RECEIVED = -1;

enum class ContentKind { POST, COMMENT };

// Items are never deleted, only tombstoned.
enum class Lifecycle { ACTIVE, REMOVED };

struct Account
{
    int64_t reputation = 0;
    uint64_t post_count = 0;
    uint64_t comment_count = 0;
};

struct Post
{
    ItemID id = 0;
    Identity author = ANONYMOUS;
    std::string content;
    int64_t votes = 0;
    Lifecycle state = Lifecycle::ACTIVE;
    // Append-only; removed comments stay in here.
    std::vector<ItemID> comment_ids;

    bool active() const { return state == Lifecycle::ACTIVE; }
};

struct Comment
{
    ItemID id = 0;
    ItemID post_id = 0;
    Identity author = ANONYMOUS;
    std::string content;
    int64_t votes = 0;
    Lifecycle state = Lifecycle::ACTIVE;

    bool active() const { return state == Lifecycle::ACTIVE; }
};

// State of one (voter, item) pair. The pair goes
// unvoted -> voted -> revoked and never leaves revoked.
struct VoteRecord
{
    bool has_voted = false;
    bool is_upvote = false;
    bool has_revoked = false;

    bool operator==(const VoteRecord& rhs) const = default;
};

struct PostView
{
    Post post;
    uint64_t comment_count = 0;
    VoteRecord viewer_vote;
    int64_t author_reputation = 0;
};

struct CommentView
{
    Comment comment;
    VoteRecord viewer_vote;
    int64_t author_reputation = 0;
};

struct PostDetails
{
    PostView post;
    std::vector<CommentView> comments;
    bool has_more = false;
};

struct UserStats
{
    Identity identity = ANONYMOUS;
    int64_t reputation = 0;
    bool is_moderator = false;
    uint64_t post_count = 0;
    uint64_t comment_count = 0;
};

struct Totals
{
    uint64_t posts = 0;
    uint64_t comments = 0;
};

struct Action
{
    enum Kind { POST_ACTION, COMMENT_ACTION, VOTE_ACTION, MODERATOR_CHANGED };

    uint64_t seq = 0;
    Kind kind = POST_ACTION;
    // Post or comment ID. For MODERATOR_CHANGED this is 0.
    ItemID item_id = 0;
    Identity actor = ANONYMOUS;
    // The account whose reputation is reported.
    Identity subject = ANONYMOUS;
    std::string label;
    int64_t reputation = 0;

    bool operator==(const Action& rhs) const = default;
};

std::string_view actionKindName(Action::Kind kind);

nlohmann::json toJson(const VoteRecord& v);
nlohmann::json toJson(const PostView& v);
nlohmann::json toJson(const CommentView& v);
nlohmann::json toJson(const PostDetails& d);
nlohmann::json toJson(const UserStats& s);
nlohmann::json toJson(const Totals& t);
nlohmann::json toJson(const Action& a);
