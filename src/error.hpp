#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <mw/error.hpp>

// Kinds of ledger rejections. The value of each kind is the HTTP
// status it is reported with.
enum class ErrorKind : int
{
    VALIDATION = 400,
    AUTHORIZATION = 403,
    NOT_FOUND = 404,
    STATE_CONFLICT = 409,
    INACTIVE = 410,
};

mw::Error ledgerError(ErrorKind kind, const std::string& msg);

// Return the kind of a ledger rejection, or nullopt if the error did
// not come from the ledger (database failure, etc).
std::optional<ErrorKind> errorKind(const mw::Error& e);

std::string_view errorKindName(ErrorKind kind);

inline bool isKind(const mw::Error& e, ErrorKind kind)
{
    return errorKind(e) == kind;
}
