#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mw/error.hpp>

#include "access_control.hpp"
#include "action_sink.hpp"
#include "content_store.hpp"
#include "query.hpp"
#include "reputation.hpp"
#include "types.hpp"
#include "vote_store.hpp"

// The reputation-weighted content ledger. Each public mutating call is
// one indivisible unit: all validation happens before the first write,
// so a rejected call changes nothing and publishes nothing, and an
// accepted call publishes exactly one action after all of its writes.
//
// Calls from different threads are serialized. A mutating call made
// while another one is still running on the same thread (e.g. from an
// action sink) is rejected with STATE_CONFLICT.
class Ledger
{
public:
    // “owner” is the deployer and starts as a moderator.
    explicit Ledger(Identity owner);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    void addSink(std::unique_ptr<ActionSinkInterface> sink);

    // Content
    mw::E<ItemID> createPost(Identity caller, std::string body);
    mw::E<ItemID> createComment(Identity caller, ItemID post_id,
                                std::string body);
    // Self-service removal by the author. Takes back the creation
    // reputation.
    mw::E<void> removeContent(Identity caller, ItemID id, ContentKind kind);
    // Takedown by a moderator or the owner. Reputation is untouched.
    mw::E<void> adminRemove(Identity caller, ItemID id, ContentKind kind,
                            const std::string& reason);

    // Votes
    mw::E<void> vote(Identity caller, ContentKind kind, ItemID id,
                     bool is_upvote);
    mw::E<void> revokeVote(Identity caller, ContentKind kind, ItemID id);

    // Roles
    mw::E<void> setModerator(Identity caller, Identity target, bool grant);

    // Queries
    mw::E<std::vector<PostView>> feed(ItemID start, uint64_t batch,
                                      Identity viewer) const;
    mw::E<PostDetails> postDetails(ItemID post_id, uint64_t comment_start,
                                   uint64_t comment_batch,
                                   Identity viewer) const;
    mw::E<CommentView> commentDetails(ItemID comment_id, Identity viewer) const;
    mw::E<UserStats> userStats(Identity who) const;
    Totals totals() const;

    Identity owner() const { return access.owner(); }
    uint64_t lastActionSeq() const;

private:
    // Holds the ledger lock for the duration of one mutating call and
    // marks the ledger as mutating. “entered()” is false if another
    // mutation on this thread already holds it.
    class MutationScope
    {
    public:
        explicit MutationScope(Ledger& l);
        ~MutationScope();
        bool entered() const { return is_entered; }

    private:
        std::unique_lock<std::recursive_mutex> lock;
        Ledger& ledger;
        bool is_entered;
    };

    mw::E<void> checkCaller(Identity caller) const;
    // Author of an active post or comment.
    mw::E<Identity> activeAuthor(ContentKind kind, ItemID id) const;
    VoteRecordStore& votesFor(ContentKind kind);
    void addVotes(ContentKind kind, ItemID id, int64_t delta);
    void publish(Action action);

    ContentStore content;
    VoteRecordStore post_votes;
    VoteRecordStore comment_votes;
    ReputationLedger reputation;
    AccessControl access;
    QueryFacade queries;

    std::vector<std::unique_ptr<ActionSinkInterface>> sinks;
    uint64_t last_seq = 0;

    mutable std::recursive_mutex mutex;
    bool mutating = false;
};
