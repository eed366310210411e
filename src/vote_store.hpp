#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>

#include <mw/error.hpp>

#include "types.hpp"

struct VoteKey
{
    Identity voter;
    ItemID item;

    bool operator==(const VoteKey& rhs) const = default;
};

struct VoteKeyHash
{
    size_t operator()(const VoteKey& k) const
    {
        size_t h = std::hash<Identity>{}(k.voter);
        return h ^ (std::hash<ItemID>{}(k.item) + 0x9e3779b97f4a7c15ULL +
                    (h << 6) + (h >> 2));
    }
};

// Vote state machine for one item namespace (posts or comments). Each
// (voter, item) pair may be voted once and revoked once, in that
// order. A revoked record is frozen.
//
// Both transitions write the record before returning, so the caller
// can apply tally and reputation effects knowing the claim is already
// recorded.
class VoteRecordStore
{
public:
    // Unvoted -> Voted. Fails with STATE_CONFLICT on self-vote, on an
    // existing vote, or after revocation. Nothing is written on
    // failure.
    mw::E<void> cast(Identity voter, ItemID item, Identity author,
                     bool is_upvote);

    // Voted -> Revoked. Returns the record as it was before the
    // revocation, so that the caller knows which direction to undo.
    mw::E<VoteRecord> revoke(Identity voter, ItemID item);

    // All-false for pairs never voted.
    VoteRecord get(Identity voter, ItemID item) const;

private:
    std::unordered_map<VoteKey, VoteRecord, VoteKeyHash> records;
};
