#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>

#include "types.hpp"

class DatabaseInterface
{
public:
    virtual ~DatabaseInterface() = default;
    virtual mw::E<void> init() = 0;

    // Action log DAO
    virtual mw::E<void> appendAction(const Action& action) = 0;
    // Actions with seq > after_seq in ascending order. “limit” is
    // capped at MAX_BATCH.
    virtual mw::E<std::vector<Action>> getActions(uint64_t after_seq,
                                                  int limit) = 0;
    // 0 if the log is empty.
    virtual mw::E<uint64_t> lastActionSeq() = 0;
};

class Database : public DatabaseInterface
{
public:
    explicit Database(const std::string& path);
    mw::E<void> init() override;

    mw::E<void> appendAction(const Action& action) override;
    mw::E<std::vector<Action>> getActions(uint64_t after_seq,
                                          int limit) override;
    mw::E<uint64_t> lastActionSeq() override;

private:
    std::string db_path;
    std::unique_ptr<mw::SQLite> db;

    mw::E<void> migrate();
};
