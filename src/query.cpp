#include "query.hpp"

#include <algorithm>
#include <format>

#include <mw/error.hpp>

#include "error.hpp"

QueryFacade::QueryFacade(const ContentStore& content,
                         const VoteRecordStore& post_votes,
                         const VoteRecordStore& comment_votes,
                         const ReputationLedger& reputation,
                         const AccessControl& access)
        : content(content), post_votes(post_votes),
          comment_votes(comment_votes), reputation(reputation), access(access)
{
}

PostView QueryFacade::postView(const Post& p, Identity viewer) const
{
    PostView v;
    v.post = p;
    v.comment_count = p.comment_ids.size();
    if(viewer != ANONYMOUS)
    {
        v.viewer_vote = post_votes.get(viewer, p.id);
    }
    v.author_reputation = reputation.reputation(p.author);
    return v;
}

CommentView QueryFacade::commentView(const Comment& c, Identity viewer) const
{
    CommentView v;
    v.comment = c;
    if(viewer != ANONYMOUS)
    {
        v.viewer_vote = comment_votes.get(viewer, c.id);
    }
    v.author_reputation = reputation.reputation(c.author);
    return v;
}

mw::E<std::vector<PostView>> QueryFacade::feed(ItemID start, uint64_t batch,
                                               Identity viewer) const
{
    if(batch == 0 || batch > MAX_BATCH)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Batch size must be in 1..{}", MAX_BATCH)));
    }

    std::vector<PostView> result;
    const ItemID last = content.lastPostID();
    if(start > last)
    {
        return result;
    }
    const ItemID end = std::min(last, start + batch - 1);
    for(ItemID id = std::max<ItemID>(start, 1); id <= end; id++)
    {
        const Post* p = content.findPost(id);
        if(p != nullptr && p->active())
        {
            result.push_back(postView(*p, viewer));
        }
    }
    return result;
}

mw::E<PostDetails> QueryFacade::postDetails(ItemID post_id,
                                            uint64_t comment_start,
                                            uint64_t comment_batch,
                                            Identity viewer) const
{
    if(comment_batch > MAX_BATCH)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Comment batch size must be at most {}", MAX_BATCH)));
    }
    const Post* p = content.findPost(post_id);
    if(p == nullptr)
    {
        return std::unexpected(ledgerError(
            ErrorKind::NOT_FOUND, std::format("Post {} not found", post_id)));
    }

    PostDetails details;
    details.post = postView(*p, viewer);

    const std::vector<ItemID>& index = p->comment_ids;
    if(comment_start >= index.size())
    {
        return details;
    }
    const uint64_t end = std::min<uint64_t>(index.size(),
                                            comment_start + comment_batch);
    for(uint64_t i = comment_start; i < end; i++)
    {
        const Comment* c = content.findComment(index[i]);
        if(c != nullptr && c->active())
        {
            details.comments.push_back(commentView(*c, viewer));
        }
    }
    details.has_more = end < index.size();
    return details;
}

mw::E<CommentView> QueryFacade::commentDetails(ItemID comment_id,
                                               Identity viewer) const
{
    const Comment* c = content.findComment(comment_id);
    if(c == nullptr)
    {
        return std::unexpected(ledgerError(
            ErrorKind::NOT_FOUND,
            std::format("Comment {} not found", comment_id)));
    }
    return commentView(*c, viewer);
}

mw::E<UserStats> QueryFacade::userStats(Identity who) const
{
    if(who == ANONYMOUS)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, "Zero identity has no account"));
    }
    UserStats stats;
    stats.identity = who;
    stats.is_moderator = access.isModerator(who);
    if(auto acc = reputation.account(who); acc.has_value())
    {
        stats.reputation = acc->reputation;
        stats.post_count = acc->post_count;
        stats.comment_count = acc->comment_count;
    }
    return stats;
}

Totals QueryFacade::totals() const
{
    return {content.lastPostID(), content.lastCommentID()};
}
