#pragma once

#include <cstdint>
#include <vector>

#include <mw/error.hpp>

#include "access_control.hpp"
#include "content_store.hpp"
#include "reputation.hpp"
#include "types.hpp"
#include "vote_store.hpp"

// Read-only projections over the ledger stores. Every scan is bounded
// by a batch size of at most MAX_BATCH.
class QueryFacade
{
public:
    QueryFacade(const ContentStore& content, const VoteRecordStore& post_votes,
                const VoteRecordStore& comment_votes,
                const ReputationLedger& reputation,
                const AccessControl& access);

    // Active posts with IDs in [start, start + batch). Empty if
    // “start” is past the last post.
    mw::E<std::vector<PostView>> feed(ItemID start, uint64_t batch,
                                      Identity viewer) const;
    // The post need not be active. Only active comments are returned
    // from the slice [comment_start, comment_start + comment_batch) of
    // the comment index.
    mw::E<PostDetails> postDetails(ItemID post_id, uint64_t comment_start,
                                   uint64_t comment_batch,
                                   Identity viewer) const;
    mw::E<CommentView> commentDetails(ItemID comment_id, Identity viewer) const;
    mw::E<UserStats> userStats(Identity who) const;
    Totals totals() const;

private:
    PostView postView(const Post& p, Identity viewer) const;
    CommentView commentView(const Comment& c, Identity viewer) const;

    const ContentStore& content;
    const VoteRecordStore& post_votes;
    const VoteRecordStore& comment_votes;
    const ReputationLedger& reputation;
    const AccessControl& access;
};
