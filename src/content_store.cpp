#include "content_store.hpp"

#include <format>
#include <utility>

#include <mw/error.hpp>
#include <mw/utils.hpp>

#include "error.hpp"

namespace {

mw::E<void> checkLength(std::string_view what, std::string_view content,
                        size_t max_len)
{
    if(content.empty())
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, std::format("{} content is empty", what)));
    }
    if(content.size() > max_len)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("{} content is longer than {} bytes", what,
                        max_len)));
    }
    return {};
}

} // namespace

mw::E<void> ContentStore::checkNewPost(std::string_view content) const
{
    return checkLength("Post", content, MAX_POST_LEN);
}

mw::E<void> ContentStore::checkNewComment(ItemID post_id,
                                          std::string_view content) const
{
    DO_OR_RETURN(checkLength("Comment", content, MAX_COMMENT_LEN));
    ASSIGN_OR_RETURN(const Post* post, activePost(post_id));
    if(post->comment_ids.size() >= MAX_COMMENTS)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Post {} reached the maximum of {} comments",
                        post_id, MAX_COMMENTS)));
    }
    return {};
}

mw::E<ItemID> ContentStore::addPost(Identity author, std::string content)
{
    DO_OR_RETURN(checkNewPost(content));
    Post p;
    p.id = posts.size() + 1;
    p.author = author;
    p.content = std::move(content);
    posts.push_back(std::move(p));
    return posts.back().id;
}

mw::E<ItemID> ContentStore::addComment(Identity author, ItemID post_id,
                                       std::string content)
{
    DO_OR_RETURN(checkNewComment(post_id, content));
    Comment c;
    c.id = comments.size() + 1;
    c.post_id = post_id;
    c.author = author;
    c.content = std::move(content);
    comments.push_back(std::move(c));
    posts[post_id - 1].comment_ids.push_back(comments.back().id);
    return comments.back().id;
}

const Post* ContentStore::findPost(ItemID id) const
{
    if(id == 0 || id > posts.size())
    {
        return nullptr;
    }
    return &posts[id - 1];
}

const Comment* ContentStore::findComment(ItemID id) const
{
    if(id == 0 || id > comments.size())
    {
        return nullptr;
    }
    return &comments[id - 1];
}

mw::E<const Post*> ContentStore::activePost(ItemID id) const
{
    const Post* p = findPost(id);
    if(p == nullptr)
    {
        return std::unexpected(ledgerError(
            ErrorKind::NOT_FOUND, std::format("Post {} not found", id)));
    }
    if(!p->active())
    {
        return std::unexpected(ledgerError(
            ErrorKind::INACTIVE, std::format("Post {} was removed", id)));
    }
    return p;
}

mw::E<const Comment*> ContentStore::activeComment(ItemID id) const
{
    const Comment* c = findComment(id);
    if(c == nullptr)
    {
        return std::unexpected(ledgerError(
            ErrorKind::NOT_FOUND, std::format("Comment {} not found", id)));
    }
    if(!c->active())
    {
        return std::unexpected(ledgerError(
            ErrorKind::INACTIVE, std::format("Comment {} was removed", id)));
    }
    return c;
}

void ContentStore::addPostVotes(ItemID id, int64_t delta)
{
    posts[id - 1].votes += delta;
}

void ContentStore::addCommentVotes(ItemID id, int64_t delta)
{
    comments[id - 1].votes += delta;
}

mw::E<void> ContentStore::removePost(ItemID id)
{
    DO_OR_RETURN(activePost(id));
    posts[id - 1].state = Lifecycle::REMOVED;
    return {};
}

mw::E<void> ContentStore::removeComment(ItemID id)
{
    DO_OR_RETURN(activeComment(id));
    comments[id - 1].state = Lifecycle::REMOVED;
    return {};
}
