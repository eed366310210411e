#include "types.hpp"

#include <nlohmann/json.hpp>

namespace {

std::string_view lifecycleName(Lifecycle s)
{
    return s == Lifecycle::ACTIVE ? "active" : "removed";
}

} // namespace

std::string_view actionKindName(Action::Kind kind)
{
    switch(kind)
    {
    case Action::POST_ACTION:
        return "PostAction";
    case Action::COMMENT_ACTION:
        return "CommentAction";
    case Action::VOTE_ACTION:
        return "VoteAction";
    case Action::MODERATOR_CHANGED:
        return "ModeratorChanged";
    }
    return "Unknown";
}

nlohmann::json toJson(const VoteRecord& v)
{
    return {
        {"has_voted", v.has_voted},
        {"is_upvote", v.is_upvote},
        {"has_revoked", v.has_revoked},
    };
}

nlohmann::json toJson(const PostView& v)
{
    return {
        {"id", v.post.id},
        {"author", v.post.author},
        {"content", v.post.content},
        {"votes", v.post.votes},
        {"state", std::string(lifecycleName(v.post.state))},
        {"comment_count", v.comment_count},
        {"viewer_vote", toJson(v.viewer_vote)},
        {"author_reputation", v.author_reputation},
    };
}

nlohmann::json toJson(const CommentView& v)
{
    return {
        {"id", v.comment.id},
        {"post_id", v.comment.post_id},
        {"author", v.comment.author},
        {"content", v.comment.content},
        {"votes", v.comment.votes},
        {"state", std::string(lifecycleName(v.comment.state))},
        {"viewer_vote", toJson(v.viewer_vote)},
        {"author_reputation", v.author_reputation},
    };
}

nlohmann::json toJson(const PostDetails& d)
{
    nlohmann::json comments = nlohmann::json::array();
    for(const CommentView& c : d.comments)
    {
        comments.push_back(toJson(c));
    }
    return {
        {"post", toJson(d.post)},
        {"comments", std::move(comments)},
        {"has_more", d.has_more},
    };
}

nlohmann::json toJson(const UserStats& s)
{
    return {
        {"identity", s.identity},
        {"reputation", s.reputation},
        {"is_moderator", s.is_moderator},
        {"post_count", s.post_count},
        {"comment_count", s.comment_count},
    };
}

nlohmann::json toJson(const Totals& t)
{
    return {{"posts", t.posts}, {"comments", t.comments}};
}

nlohmann::json toJson(const Action& a)
{
    return {
        {"seq", a.seq},
        {"kind", std::string(actionKindName(a.kind))},
        {"item_id", a.item_id},
        {"actor", a.actor},
        {"subject", a.subject},
        {"label", a.label},
        {"reputation", a.reputation},
    };
}
