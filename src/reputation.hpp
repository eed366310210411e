#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include <mw/error.hpp>

#include "types.hpp"

// Add “delta” to “rep” and pin the result into [MIN_REP, MAX_REP].
// “rep” must already be in range.
int64_t saturatingAdd(int64_t rep, int64_t delta);

// Per-identity account book. This is the only place reputation
// scores are changed. Accounts are created on the first mutation that
// touches an identity and are never removed.
class ReputationLedger
{
public:
    // Returns the resulting reputation.
    mw::E<int64_t> adjust(Identity who, int64_t delta);

    mw::E<void> countPost(Identity who);
    mw::E<void> countComment(Identity who);

    // Zero for identities never seen.
    int64_t reputation(Identity who) const;
    std::optional<Account> account(Identity who) const;
    size_t size() const { return accounts.size(); }

private:
    mw::E<Account*> touch(Identity who);

    std::unordered_map<Identity, Account> accounts;
};
