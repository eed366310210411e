#include "vote_store.hpp"

#include <format>

#include "error.hpp"

mw::E<void> VoteRecordStore::cast(Identity voter, ItemID item,
                                  Identity author, bool is_upvote)
{
    if(voter == author)
    {
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT, "Cannot vote on your own content"));
    }
    VoteRecord current = get(voter, item);
    if(current.has_revoked)
    {
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT,
            std::format("Vote on item {} was revoked and cannot be cast again",
                        item)));
    }
    if(current.has_voted)
    {
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT,
            std::format("Already voted on item {}", item)));
    }

    VoteRecord& rec = records[VoteKey{voter, item}];
    rec.has_voted = true;
    rec.is_upvote = is_upvote;
    return {};
}

mw::E<VoteRecord> VoteRecordStore::revoke(Identity voter, ItemID item)
{
    auto it = records.find(VoteKey{voter, item});
    if(it == std::end(records) || !it->second.has_voted)
    {
        if(it != std::end(records) && it->second.has_revoked)
        {
            return std::unexpected(ledgerError(
                ErrorKind::STATE_CONFLICT,
                std::format("Vote on item {} is already revoked", item)));
        }
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT,
            std::format("No vote on item {} to revoke", item)));
    }

    VoteRecord before = it->second;
    it->second.has_voted = false;
    it->second.has_revoked = true;
    return before;
}

VoteRecord VoteRecordStore::get(Identity voter, ItemID item) const
{
    auto it = records.find(VoteKey{voter, item});
    if(it == std::end(records))
    {
        return {};
    }
    return it->second;
}
