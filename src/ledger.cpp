#include "ledger.hpp"

#include <format>
#include <utility>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "error.hpp"

Ledger::MutationScope::MutationScope(Ledger& l)
        : lock(l.mutex), ledger(l), is_entered(!l.mutating)
{
    if(is_entered)
    {
        ledger.mutating = true;
    }
}

Ledger::MutationScope::~MutationScope()
{
    if(is_entered)
    {
        ledger.mutating = false;
    }
}

#define ENTER_MUTATION_OR_RETURN(scope)                                 \
    MutationScope scope(*this);                                         \
    if(!scope.entered())                                                \
    {                                                                   \
        return std::unexpected(ledgerError(                             \
            ErrorKind::STATE_CONFLICT,                                  \
            "Re-entrant call into the ledger rejected"));               \
    }

Ledger::Ledger(Identity owner)
        : access(owner),
          queries(content, post_votes, comment_votes, reputation, access)
{
    if(owner == ANONYMOUS)
    {
        spdlog::warn("Ledger has no owner. Nobody can moderate.");
    }
    else
    {
        spdlog::info("Ledger initialized with owner {}.", owner);
    }
}

void Ledger::addSink(std::unique_ptr<ActionSinkInterface> sink)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    sinks.push_back(std::move(sink));
}

mw::E<void> Ledger::checkCaller(Identity caller) const
{
    if(caller == ANONYMOUS)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, "Caller identity cannot be zero"));
    }
    return {};
}

mw::E<Identity> Ledger::activeAuthor(ContentKind kind, ItemID id) const
{
    if(kind == ContentKind::POST)
    {
        ASSIGN_OR_RETURN(const Post* p, content.activePost(id));
        return p->author;
    }
    ASSIGN_OR_RETURN(const Comment* c, content.activeComment(id));
    return c->author;
}

VoteRecordStore& Ledger::votesFor(ContentKind kind)
{
    return kind == ContentKind::POST ? post_votes : comment_votes;
}

void Ledger::addVotes(ContentKind kind, ItemID id, int64_t delta)
{
    if(kind == ContentKind::POST)
    {
        content.addPostVotes(id, delta);
    }
    else
    {
        content.addCommentVotes(id, delta);
    }
}

void Ledger::publish(Action action)
{
    action.seq = ++last_seq;
    // A sink may add sinks while publishing. Those start with the next
    // action.
    const size_t count = sinks.size();
    for(size_t i = 0; i < count; i++)
    {
        auto res = sinks[i]->publish(action);
        if(!res)
        {
            spdlog::error("Failed to publish action #{}: {}", action.seq,
                          mw::errorMsg(res.error()));
        }
    }
}

mw::E<ItemID> Ledger::createPost(Identity caller, std::string body)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    ASSIGN_OR_RETURN(ItemID id, content.addPost(caller, std::move(body)));
    DO_OR_RETURN(reputation.countPost(caller));
    ASSIGN_OR_RETURN(int64_t rep,
                     reputation.adjust(caller, REP_POST_CREATED));
    spdlog::debug("{} created post {}.", caller, id);
    publish({0, Action::POST_ACTION, id, caller, caller, "created", rep});
    return id;
}

mw::E<ItemID> Ledger::createComment(Identity caller, ItemID post_id,
                                    std::string body)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    ASSIGN_OR_RETURN(ItemID id,
                     content.addComment(caller, post_id, std::move(body)));
    DO_OR_RETURN(reputation.countComment(caller));
    ASSIGN_OR_RETURN(int64_t rep,
                     reputation.adjust(caller, REP_COMMENT_CREATED));
    spdlog::debug("{} created comment {} on post {}.", caller, id, post_id);
    publish({0, Action::COMMENT_ACTION, id, caller, caller, "created", rep});
    return id;
}

mw::E<void> Ledger::removeContent(Identity caller, ItemID id,
                                  ContentKind kind)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    ASSIGN_OR_RETURN(Identity author, activeAuthor(kind, id));
    if(author != caller)
    {
        spdlog::warn("{} tried to remove item {} owned by {}.", caller, id,
                     author);
        return std::unexpected(ledgerError(
            ErrorKind::AUTHORIZATION,
            std::format("Only the author can remove item {}", id)));
    }

    int64_t delta;
    Action::Kind action_kind;
    if(kind == ContentKind::POST)
    {
        DO_OR_RETURN(content.removePost(id));
        delta = -REP_POST_CREATED;
        action_kind = Action::POST_ACTION;
    }
    else
    {
        DO_OR_RETURN(content.removeComment(id));
        delta = -REP_COMMENT_CREATED;
        action_kind = Action::COMMENT_ACTION;
    }
    ASSIGN_OR_RETURN(int64_t rep, reputation.adjust(caller, delta));
    spdlog::debug("{} removed item {}.", caller, id);
    publish({0, action_kind, id, caller, caller, "removed", rep});
    return {};
}

mw::E<void> Ledger::adminRemove(Identity caller, ItemID id, ContentKind kind,
                                const std::string& reason)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    if(!access.canModerate(caller))
    {
        spdlog::warn("{} is not allowed to moderate item {}.", caller, id);
        return std::unexpected(ledgerError(
            ErrorKind::AUTHORIZATION, "Only moderators can remove content"));
    }
    ASSIGN_OR_RETURN(Identity author, activeAuthor(kind, id));

    Action::Kind action_kind;
    if(kind == ContentKind::POST)
    {
        DO_OR_RETURN(content.removePost(id));
        action_kind = Action::POST_ACTION;
    }
    else
    {
        DO_OR_RETURN(content.removeComment(id));
        action_kind = Action::COMMENT_ACTION;
    }
    spdlog::debug("{} took down item {}: {}", caller, id, reason);
    publish({0, action_kind, id, caller, author,
             std::format("moderated: {}", reason),
             reputation.reputation(author)});
    return {};
}

mw::E<void> Ledger::vote(Identity caller, ContentKind kind, ItemID id,
                         bool is_upvote)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    ASSIGN_OR_RETURN(Identity author, activeAuthor(kind, id));
    // The vote is claimed here, before any tally or reputation change.
    DO_OR_RETURN(votesFor(kind).cast(caller, id, author, is_upvote));

    addVotes(kind, id, is_upvote ? 1 : -1);
    ASSIGN_OR_RETURN(int64_t rep, reputation.adjust(
                         author, is_upvote ? REP_UPVOTE_RECEIVED
                                           : REP_DOWNVOTE_RECEIVED));
    spdlog::debug("{} {}voted item {}.", caller, is_upvote ? "up" : "down",
                  id);
    publish({0, Action::VOTE_ACTION, id, caller, author,
             is_upvote ? "upvote" : "downvote", rep});
    return {};
}

mw::E<void> Ledger::revokeVote(Identity caller, ContentKind kind, ItemID id)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    ASSIGN_OR_RETURN(Identity author, activeAuthor(kind, id));
    // Frozen before the original effects are undone.
    ASSIGN_OR_RETURN(VoteRecord before, votesFor(kind).revoke(caller, id));

    addVotes(kind, id, before.is_upvote ? -1 : 1);
    ASSIGN_OR_RETURN(int64_t rep, reputation.adjust(
                         author, before.is_upvote ? -REP_UPVOTE_RECEIVED
                                                  : -REP_DOWNVOTE_RECEIVED));
    spdlog::debug("{} revoked vote on item {}.", caller, id);
    publish({0, Action::VOTE_ACTION, id, caller, author, "revoked", rep});
    return {};
}

mw::E<void> Ledger::setModerator(Identity caller, Identity target, bool grant)
{
    ENTER_MUTATION_OR_RETURN(scope);
    DO_OR_RETURN(checkCaller(caller));
    if(auto check = access.checkSetModerator(caller, target, grant); !check)
    {
        if(isKind(check.error(), ErrorKind::AUTHORIZATION))
        {
            spdlog::warn("{} is not allowed to change moderators.", caller);
        }
        return std::unexpected(check.error());
    }
    DO_OR_RETURN(access.setModerator(caller, target, grant));
    spdlog::debug("{} {} moderator {}.", caller,
                  grant ? "granted" : "revoked", target);
    publish({0, Action::MODERATOR_CHANGED, 0, caller, target,
             grant ? "granted" : "revoked-moderator",
             reputation.reputation(target)});
    return {};
}

mw::E<std::vector<PostView>> Ledger::feed(ItemID start, uint64_t batch,
                                          Identity viewer) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return queries.feed(start, batch, viewer);
}

mw::E<PostDetails> Ledger::postDetails(ItemID post_id, uint64_t comment_start,
                                       uint64_t comment_batch,
                                       Identity viewer) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return queries.postDetails(post_id, comment_start, comment_batch, viewer);
}

mw::E<CommentView> Ledger::commentDetails(ItemID comment_id,
                                          Identity viewer) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return queries.commentDetails(comment_id, viewer);
}

mw::E<UserStats> Ledger::userStats(Identity who) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return queries.userStats(who);
}

Totals Ledger::totals() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return queries.totals();
}

uint64_t Ledger::lastActionSeq() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return last_seq;
}
