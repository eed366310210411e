#pragma once

#include <unordered_set>

#include <mw/error.hpp>

#include "types.hpp"

// Owner and moderator role table. Each ledger holds its own instance.
// The owner is always a moderator.
class AccessControl
{
public:
    explicit AccessControl(Identity owner);

    Identity owner() const { return owner_id; }
    bool isOwner(Identity who) const { return who != ANONYMOUS && who == owner_id; }
    bool isModerator(Identity who) const;
    // True for moderators and the owner.
    bool canModerate(Identity who) const;

    // Only the owner may change the moderator set. Granting an
    // existing moderator, revoking a non-moderator, and revoking the
    // owner are STATE_CONFLICT.
    mw::E<void> checkSetModerator(Identity caller, Identity target,
                                  bool grant) const;
    mw::E<void> setModerator(Identity caller, Identity target, bool grant);

private:
    Identity owner_id;
    std::unordered_set<Identity> moderators;
};
