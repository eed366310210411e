#include "error.hpp"

#include <variant>

mw::Error ledgerError(ErrorKind kind, const std::string& msg)
{
    return mw::httpError(static_cast<int>(kind), msg);
}

std::optional<ErrorKind> errorKind(const mw::Error& e)
{
    if(!std::holds_alternative<mw::HTTPError>(e))
    {
        return std::nullopt;
    }
    switch(std::get<mw::HTTPError>(e).code)
    {
    case static_cast<int>(ErrorKind::VALIDATION):
        return ErrorKind::VALIDATION;
    case static_cast<int>(ErrorKind::AUTHORIZATION):
        return ErrorKind::AUTHORIZATION;
    case static_cast<int>(ErrorKind::NOT_FOUND):
        return ErrorKind::NOT_FOUND;
    case static_cast<int>(ErrorKind::STATE_CONFLICT):
        return ErrorKind::STATE_CONFLICT;
    case static_cast<int>(ErrorKind::INACTIVE):
        return ErrorKind::INACTIVE;
    default:
        return std::nullopt;
    }
}

std::string_view errorKindName(ErrorKind kind)
{
    switch(kind)
    {
    case ErrorKind::VALIDATION:
        return "ValidationError";
    case ErrorKind::AUTHORIZATION:
        return "AuthorizationError";
    case ErrorKind::NOT_FOUND:
        return "NotFoundError";
    case ErrorKind::STATE_CONFLICT:
        return "StateConflict";
    case ErrorKind::INACTIVE:
        return "InactiveError";
    }
    return "UnknownError";
}
