#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

#include "types.hpp"

// Arena of posts and comments. IDs are dense and start at 1; the item
// with ID n lives at index n - 1 and is never erased.
class ContentStore
{
public:
    // Check that a new post could be created, without creating it.
    mw::E<void> checkNewPost(std::string_view content) const;
    mw::E<void> checkNewComment(ItemID post_id, std::string_view content) const;

    // These run the same checks again and then append.
    mw::E<ItemID> addPost(Identity author, std::string content);
    mw::E<ItemID> addComment(Identity author, ItemID post_id,
                             std::string content);

    // Nullptr if the ID was never assigned.
    const Post* findPost(ItemID id) const;
    const Comment* findComment(ItemID id) const;

    // NOT_FOUND if the ID was never assigned, INACTIVE if removed.
    mw::E<const Post*> activePost(ItemID id) const;
    mw::E<const Comment*> activeComment(ItemID id) const;

    // Apply a tally change to an item known to exist.
    void addPostVotes(ItemID id, int64_t delta);
    void addCommentVotes(ItemID id, int64_t delta);

    // Tombstone an active item. One way.
    mw::E<void> removePost(ItemID id);
    mw::E<void> removeComment(ItemID id);

    ItemID lastPostID() const { return posts.size(); }
    ItemID lastCommentID() const { return comments.size(); }

private:
    std::vector<Post> posts;
    std::vector<Comment> comments;
};
