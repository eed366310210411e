#pragma once

#include <cstdint>
#include <string>
#include <thread>

#include <httplib.h>
#include <mw/error.hpp>
#include <nlohmann/json.hpp>

#include "database.hpp"
#include "ledger.hpp"
#include "types.hpp"

// Header carrying the caller identity. It is set by the
// authenticating proxy in front of this server and is trusted as is.
constexpr char IDENTITY_HEADER[] = "X-Karma-Identity";

// Parse a decimal unsigned integer. The whole string must be
// consumed.
mw::E<uint64_t> parseUint(const std::string& s);

// JSON-over-HTTP gateway to a ledger.
class App
{
public:
    App() = delete;
    // “actions_db” may be null, in which case the action log is not
    // served.
    App(Ledger& ledger, DatabaseInterface* actions_db,
        const std::string& address, int port);
    ~App();

    mw::E<void> start();
    void stop();
    // Block until the server thread exits.
    void wait();

    void handleCreatePost(const httplib::Request& req, httplib::Response& res);
    void handleCreateComment(const httplib::Request& req,
                             httplib::Response& res);
    void handleVote(const httplib::Request& req, httplib::Response& res,
                    ContentKind kind);
    void handleRevokeVote(const httplib::Request& req, httplib::Response& res,
                          ContentKind kind);
    void handleRemove(const httplib::Request& req, httplib::Response& res,
                      ContentKind kind);
    void handleAdminRemove(const httplib::Request& req, httplib::Response& res,
                           ContentKind kind);
    void handleSetModerator(const httplib::Request& req,
                            httplib::Response& res, bool grant);
    void handleFeed(const httplib::Request& req, httplib::Response& res);
    void handlePostDetails(const httplib::Request& req, httplib::Response& res);
    void handleCommentDetails(const httplib::Request& req,
                              httplib::Response& res);
    void handleUserStats(const httplib::Request& req, httplib::Response& res);
    void handleTotals(httplib::Response& res);
    void handleActions(const httplib::Request& req, httplib::Response& res);

private:
    void setup();

    Ledger& ledger;
    DatabaseInterface* actions_db;
    std::string address;
    int port;
    httplib::Server server;
    std::thread server_thread;
};
