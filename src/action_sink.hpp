#pragma once

#include <mw/error.hpp>

#include "database.hpp"
#include "types.hpp"

// An append-only consumer of the ledger's action stream.
class ActionSinkInterface
{
public:
    virtual ~ActionSinkInterface() = default;
    virtual mw::E<void> publish(const Action& action) = 0;
};

// Writes every action to the log.
class LogActionSink : public ActionSinkInterface
{
public:
    mw::E<void> publish(const Action& action) override;
};

// Appends every action to the durable action log.
class DatabaseActionSink : public ActionSinkInterface
{
public:
    explicit DatabaseActionSink(DatabaseInterface& db) : db(db) {}
    mw::E<void> publish(const Action& action) override;

private:
    DatabaseInterface& db;
};
