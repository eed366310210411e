#include "database.hpp"

#include <algorithm>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

Database::Database(const std::string& path) : db_path(path) {}

mw::E<void> Database::init()
{
    auto conn = mw::SQLite::connectFile(db_path);
    if(!conn)
    {
        return std::unexpected(conn.error());
    }
    db = std::move(*conn);

    DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));
    return migrate();
}

mw::E<void> Database::migrate()
{
    auto version_res = db->evalToValue<int>("PRAGMA user_version;");
    if(!version_res)
    {
        return std::unexpected(version_res.error());
    }

    int version = *version_res;

    if(version == 0)
    {
        spdlog::info("Creating database schema v1...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS actions (
                seq INTEGER PRIMARY KEY,
                kind INTEGER NOT NULL,
                item_id INTEGER NOT NULL,
                actor INTEGER NOT NULL,
                subject INTEGER NOT NULL,
                label TEXT NOT NULL,
                reputation INTEGER NOT NULL
            );)",

            "PRAGMA user_version = 1;"};

        for(const auto& sql : statements)
        {
            auto res = db->execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(res.error());
            }
        }
    }

    return {};
}

mw::E<void> Database::appendAction(const Action& action)
{
    const char* sql =
        "INSERT INTO actions (seq, kind, item_id, actor, subject, label, "
        "reputation) VALUES (?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));

    // Identities and IDs are stored as their two’s complement int64.
    DO_OR_RETURN(stmt.bind(
        static_cast<int64_t>(action.seq), static_cast<int>(action.kind),
        static_cast<int64_t>(action.item_id),
        static_cast<int64_t>(action.actor),
        static_cast<int64_t>(action.subject), action.label,
        action.reputation));
    return db->execute(std::move(stmt));
}

using ActionTuple = std::tuple<int64_t, int, int64_t, int64_t, int64_t,
                               std::string, int64_t>;

static Action rowToAction(const ActionTuple& row)
{
    Action a;
    a.seq = static_cast<uint64_t>(std::get<0>(row));
    a.kind = static_cast<Action::Kind>(std::get<1>(row));
    a.item_id = static_cast<ItemID>(std::get<2>(row));
    a.actor = static_cast<Identity>(std::get<3>(row));
    a.subject = static_cast<Identity>(std::get<4>(row));
    a.label = std::get<5>(row);
    a.reputation = std::get<6>(row);
    return a;
}

mw::E<std::vector<Action>> Database::getActions(uint64_t after_seq, int limit)
{
    limit = std::clamp(limit, 0, static_cast<int>(MAX_BATCH));
    const char* sql =
        "SELECT seq, kind, item_id, actor, subject, label, reputation "
        "FROM actions WHERE seq > ? ORDER BY seq ASC LIMIT ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(static_cast<int64_t>(after_seq), limit));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<int64_t, int, int64_t, int64_t, int64_t, std::string,
                  int64_t>(std::move(stmt))));

    std::vector<Action> actions;
    actions.reserve(rows.size());
    for(const auto& row : rows)
    {
        actions.push_back(rowToAction(row));
    }
    return actions;
}

mw::E<uint64_t> Database::lastActionSeq()
{
    ASSIGN_OR_RETURN(int64_t seq, db->evalToValue<int64_t>(
                         "SELECT COALESCE(MAX(seq), 0) FROM actions;"));
    return static_cast<uint64_t>(seq);
}
