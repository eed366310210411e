#include "reputation.hpp"


#include <mw/error.hpp>
#include <mw/utils.hpp>

#include "error.hpp"

int64_t saturatingAdd(int64_t rep, int64_t delta)
{
    if(delta > 0 && delta > MAX_REP - rep)
    {
        return MAX_REP;
    }
    if(delta < 0 && delta < MIN_REP - rep)
    {
        return MIN_REP;
    }
    return rep + delta;
}

mw::E<Account*> ReputationLedger::touch(Identity who)
{
    if(who == ANONYMOUS)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, "Zero identity cannot hold an account"));
    }
    return &accounts[who];
}

mw::E<int64_t> ReputationLedger::adjust(Identity who, int64_t delta)
{
    ASSIGN_OR_RETURN(Account* acc, touch(who));
    acc->reputation = saturatingAdd(acc->reputation, delta);
    return acc->reputation;
}

mw::E<void> ReputationLedger::countPost(Identity who)
{
    ASSIGN_OR_RETURN(Account* acc, touch(who));
    acc->post_count++;
    return {};
}

mw::E<void> ReputationLedger::countComment(Identity who)
{
    ASSIGN_OR_RETURN(Account* acc, touch(who));
    acc->comment_count++;
    return {};
}

int64_t ReputationLedger::reputation(Identity who) const
{
    auto it = accounts.find(who);
    if(it == std::end(accounts))
    {
        return 0;
    }
    return it->second.reputation;
}

std::optional<Account> ReputationLedger::account(Identity who) const
{
    auto it = accounts.find(who);
    if(it == std::end(accounts))
    {
        return std::nullopt;
    }
    return it->second;
}
