#include "access_control.hpp"

#include <format>

#include <mw/error.hpp>
#include <mw/utils.hpp>

#include "error.hpp"

AccessControl::AccessControl(Identity owner) : owner_id(owner)
{
    if(owner != ANONYMOUS)
    {
        moderators.insert(owner);
    }
}

bool AccessControl::isModerator(Identity who) const
{
    return moderators.contains(who);
}

bool AccessControl::canModerate(Identity who) const
{
    return isOwner(who) || isModerator(who);
}

mw::E<void> AccessControl::checkSetModerator(Identity caller, Identity target,
                                             bool grant) const
{
    if(!isOwner(caller))
    {
        return std::unexpected(ledgerError(
            ErrorKind::AUTHORIZATION, "Only the owner can change moderators"));
    }
    if(target == ANONYMOUS)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, "Moderator identity cannot be zero"));
    }
    if(grant)
    {
        if(isModerator(target))
        {
            return std::unexpected(ledgerError(
                ErrorKind::STATE_CONFLICT,
                std::format("{} is already a moderator", target)));
        }
        return {};
    }
    if(target == owner_id)
    {
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT,
            "The owner's moderator status cannot be revoked"));
    }
    if(!isModerator(target))
    {
        return std::unexpected(ledgerError(
            ErrorKind::STATE_CONFLICT,
            std::format("{} is not a moderator", target)));
    }
    return {};
}

mw::E<void> AccessControl::setModerator(Identity caller, Identity target,
                                        bool grant)
{
    DO_OR_RETURN(checkSetModerator(caller, target, grant));
    if(grant)
    {
        moderators.insert(target);
    }
    else
    {
        moderators.erase(target);
    }
    return {};
}
