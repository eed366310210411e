#include "app.hpp"

#include <charconv>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <httplib.h>
#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "error.hpp"

namespace {

constexpr char CONTENT_TYPE_JSON[] = "application/json";

void respondError(const mw::Error& e, httplib::Response& res)
{
    nlohmann::json body;
    if(auto kind = errorKind(e); kind.has_value())
    {
        res.status = static_cast<int>(*kind);
        body["error"] = std::string(errorKindName(*kind));
    }
    else
    {
        spdlog::error("Request failed: {}", mw::errorMsg(e));
        res.status = 500;
        body["error"] = "InternalError";
    }
    body["message"] = mw::errorMsg(e);
    res.set_content(body.dump(), CONTENT_TYPE_JSON);
}

void respondJson(const nlohmann::json& body, httplib::Response& res,
                 int status = 200)
{
    res.status = status;
    res.set_content(body.dump(), CONTENT_TYPE_JSON);
}

mw::E<Identity> callerOf(const httplib::Request& req)
{
    if(!req.has_header(IDENTITY_HEADER))
    {
        return ANONYMOUS;
    }
    auto id = parseUint(req.get_header_value(IDENTITY_HEADER));
    if(!id.has_value())
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Invalid {} header", IDENTITY_HEADER)));
    }
    return *id;
}

// Query routes treat a missing or unreadable identity as anonymous.
Identity viewerOf(const httplib::Request& req)
{
    return callerOf(req).value_or(ANONYMOUS);
}

// The first regex group of the route.
mw::E<uint64_t> pathID(const httplib::Request& req)
{
    if(req.matches.size() < 2)
    {
        return std::unexpected(ledgerError(ErrorKind::VALIDATION,
                                           "Missing ID in path"));
    }
    return parseUint(req.matches[1].str());
}

mw::E<uint64_t> uintParam(const httplib::Request& req, const char* key,
                          uint64_t fallback)
{
    if(!req.has_param(key))
    {
        return fallback;
    }
    return parseUint(req.get_param_value(key));
}

mw::E<nlohmann::json> jsonBody(const httplib::Request& req)
{
    nlohmann::json j = nlohmann::json::parse(req.body, nullptr, false);
    if(j.is_discarded() || !j.is_object())
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION, "Request body must be a JSON object"));
    }
    return j;
}

mw::E<std::string> stringField(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_string())
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Field “{}” must be a string", key)));
    }
    return j[key].get<std::string>();
}

mw::E<bool> boolField(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_boolean())
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Field “{}” must be a boolean", key)));
    }
    return j[key].get<bool>();
}

} // namespace

#define _ASSIGN_OR_RESPOND_ERROR(tmp, var, val, res)                    \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        respondError(tmp.error(), res);                                 \
        return;                                                         \
    }                                                                   \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RESPOND_ERROR(var, val, res)                          \
    _ASSIGN_OR_RESPOND_ERROR(_CONCAT_NAMES(assign_or_respond_tmp, __COUNTER__), \
                             var, val, res)

#define _DO_OR_RESPOND_ERROR(tmp, val, res)                             \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        respondError(tmp.error(), res);                                 \
        return;                                                         \
    }

#define DO_OR_RESPOND_ERROR(val, res)                                   \
    _DO_OR_RESPOND_ERROR(_CONCAT_NAMES(do_or_respond_tmp, __COUNTER__), \
                         val, res)

mw::E<uint64_t> parseUint(const std::string& s)
{
    uint64_t value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if(s.empty() || ec != std::errc() || ptr != end)
    {
        return std::unexpected(ledgerError(
            ErrorKind::VALIDATION,
            std::format("Invalid unsigned integer: {}", s)));
    }
    return value;
}

App::App(Ledger& l, DatabaseInterface* db, const std::string& addr, int p)
        : ledger(l), actions_db(db), address(addr), port(p)
{
    setup();
}

App::~App()
{
    stop();
    wait();
}

void App::setup()
{
    server.Post("/posts", [&](const httplib::Request& req,
                              httplib::Response& res)
    {
        handleCreatePost(req, res);
    });
    server.Post(R"(/posts/(\d+)/comments)", [&](const httplib::Request& req,
                                                httplib::Response& res)
    {
        handleCreateComment(req, res);
    });
    server.Post(R"(/posts/(\d+)/vote)", [&](const httplib::Request& req,
                                            httplib::Response& res)
    {
        handleVote(req, res, ContentKind::POST);
    });
    server.Delete(R"(/posts/(\d+)/vote)", [&](const httplib::Request& req,
                                              httplib::Response& res)
    {
        handleRevokeVote(req, res, ContentKind::POST);
    });
    server.Post(R"(/comments/(\d+)/vote)", [&](const httplib::Request& req,
                                               httplib::Response& res)
    {
        handleVote(req, res, ContentKind::COMMENT);
    });
    server.Delete(R"(/comments/(\d+)/vote)", [&](const httplib::Request& req,
                                                 httplib::Response& res)
    {
        handleRevokeVote(req, res, ContentKind::COMMENT);
    });
    server.Delete(R"(/posts/(\d+))", [&](const httplib::Request& req,
                                         httplib::Response& res)
    {
        handleRemove(req, res, ContentKind::POST);
    });
    server.Delete(R"(/comments/(\d+))", [&](const httplib::Request& req,
                                            httplib::Response& res)
    {
        handleRemove(req, res, ContentKind::COMMENT);
    });
    server.Post(R"(/moderation/posts/(\d+)/remove)",
                [&](const httplib::Request& req, httplib::Response& res)
    {
        handleAdminRemove(req, res, ContentKind::POST);
    });
    server.Post(R"(/moderation/comments/(\d+)/remove)",
                [&](const httplib::Request& req, httplib::Response& res)
    {
        handleAdminRemove(req, res, ContentKind::COMMENT);
    });
    server.Put(R"(/moderators/(\d+))", [&](const httplib::Request& req,
                                           httplib::Response& res)
    {
        handleSetModerator(req, res, true);
    });
    server.Delete(R"(/moderators/(\d+))", [&](const httplib::Request& req,
                                              httplib::Response& res)
    {
        handleSetModerator(req, res, false);
    });
    server.Get("/feed", [&](const httplib::Request& req,
                            httplib::Response& res)
    {
        handleFeed(req, res);
    });
    server.Get(R"(/posts/(\d+))", [&](const httplib::Request& req,
                                      httplib::Response& res)
    {
        handlePostDetails(req, res);
    });
    server.Get(R"(/comments/(\d+))", [&](const httplib::Request& req,
                                         httplib::Response& res)
    {
        handleCommentDetails(req, res);
    });
    server.Get(R"(/users/(\d+))", [&](const httplib::Request& req,
                                      httplib::Response& res)
    {
        handleUserStats(req, res);
    });
    server.Get("/totals", [&](const httplib::Request&, httplib::Response& res)
    {
        handleTotals(res);
    });
    server.Get("/actions", [&](const httplib::Request& req,
                               httplib::Response& res)
    {
        handleActions(req, res);
    });
}

mw::E<void> App::start()
{
    if(!server.bind_to_port(address, port))
    {
        return std::unexpected(mw::runtimeError(
            std::format("Failed to listen on {}:{}", address, port)));
    }
    server_thread = std::thread([this]() { server.listen_after_bind(); });
    server.wait_until_ready();
    spdlog::info("Listening on {}:{}...", address, port);
    return {};
}

void App::stop()
{
    if(server.is_running())
    {
        server.stop();
    }
}

void App::wait()
{
    if(server_thread.joinable())
    {
        server_thread.join();
    }
}

void App::handleCreatePost(const httplib::Request& req, httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, jsonBody(req), res);
    ASSIGN_OR_RESPOND_ERROR(std::string content, stringField(body, "content"),
                            res);
    ASSIGN_OR_RESPOND_ERROR(ItemID id,
                            ledger.createPost(caller, std::move(content)), res);
    respondJson({{"id", id}}, res, 201);
}

void App::handleCreateComment(const httplib::Request& req,
                              httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(ItemID post_id, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, jsonBody(req), res);
    ASSIGN_OR_RESPOND_ERROR(std::string content, stringField(body, "content"),
                            res);
    ASSIGN_OR_RESPOND_ERROR(
        ItemID id, ledger.createComment(caller, post_id, std::move(content)),
        res);
    respondJson({{"id", id}}, res, 201);
}

void App::handleVote(const httplib::Request& req, httplib::Response& res,
                     ContentKind kind)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, jsonBody(req), res);
    ASSIGN_OR_RESPOND_ERROR(bool upvote, boolField(body, "upvote"), res);
    DO_OR_RESPOND_ERROR(ledger.vote(caller, kind, id, upvote), res);
    res.status = 204;
}

void App::handleRevokeVote(const httplib::Request& req, httplib::Response& res,
                           ContentKind kind)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    DO_OR_RESPOND_ERROR(ledger.revokeVote(caller, kind, id), res);
    res.status = 204;
}

void App::handleRemove(const httplib::Request& req, httplib::Response& res,
                       ContentKind kind)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    DO_OR_RESPOND_ERROR(ledger.removeContent(caller, id, kind), res);
    res.status = 204;
}

void App::handleAdminRemove(const httplib::Request& req,
                            httplib::Response& res, ContentKind kind)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, jsonBody(req), res);
    ASSIGN_OR_RESPOND_ERROR(std::string reason, stringField(body, "reason"),
                            res);
    DO_OR_RESPOND_ERROR(ledger.adminRemove(caller, id, kind, reason), res);
    res.status = 204;
}

void App::handleSetModerator(const httplib::Request& req,
                             httplib::Response& res, bool grant)
{
    ASSIGN_OR_RESPOND_ERROR(Identity caller, callerOf(req), res);
    ASSIGN_OR_RESPOND_ERROR(Identity target, pathID(req), res);
    DO_OR_RESPOND_ERROR(ledger.setModerator(caller, target, grant), res);
    res.status = 204;
}

void App::handleFeed(const httplib::Request& req, httplib::Response& res)
{
    Identity viewer = viewerOf(req);
    ASSIGN_OR_RESPOND_ERROR(uint64_t start, uintParam(req, "start", 1), res);
    ASSIGN_OR_RESPOND_ERROR(
        uint64_t batch, uintParam(req, "batch", Config::get().default_batch),
        res);
    ASSIGN_OR_RESPOND_ERROR(std::vector<PostView> posts,
                            ledger.feed(start, batch, viewer), res);
    nlohmann::json result = nlohmann::json::array();
    for(const PostView& p : posts)
    {
        result.push_back(toJson(p));
    }
    respondJson(result, res);
}

void App::handlePostDetails(const httplib::Request& req,
                            httplib::Response& res)
{
    Identity viewer = viewerOf(req);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(uint64_t start, uintParam(req, "start", 0), res);
    ASSIGN_OR_RESPOND_ERROR(
        uint64_t batch, uintParam(req, "batch", Config::get().default_batch),
        res);
    ASSIGN_OR_RESPOND_ERROR(PostDetails details,
                            ledger.postDetails(id, start, batch, viewer), res);
    respondJson(toJson(details), res);
}

void App::handleCommentDetails(const httplib::Request& req,
                               httplib::Response& res)
{
    Identity viewer = viewerOf(req);
    ASSIGN_OR_RESPOND_ERROR(ItemID id, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(CommentView comment,
                            ledger.commentDetails(id, viewer), res);
    respondJson(toJson(comment), res);
}

void App::handleUserStats(const httplib::Request& req, httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(Identity who, pathID(req), res);
    ASSIGN_OR_RESPOND_ERROR(UserStats stats, ledger.userStats(who), res);
    respondJson(toJson(stats), res);
}

void App::handleTotals(httplib::Response& res)
{
    respondJson(toJson(ledger.totals()), res);
}

void App::handleActions(const httplib::Request& req, httplib::Response& res)
{
    if(actions_db == nullptr)
    {
        respondError(ledgerError(ErrorKind::NOT_FOUND,
                                 "Action log is not enabled"), res);
        return;
    }
    ASSIGN_OR_RESPOND_ERROR(uint64_t after, uintParam(req, "after", 0), res);
    ASSIGN_OR_RESPOND_ERROR(
        uint64_t limit, uintParam(req, "limit", Config::get().default_batch),
        res);
    if(limit > MAX_BATCH)
    {
        limit = MAX_BATCH;
    }
    ASSIGN_OR_RESPOND_ERROR(
        std::vector<Action> actions,
        actions_db->getActions(after, static_cast<int>(limit)), res);
    nlohmann::json result = nlohmann::json::array();
    for(const Action& a : actions)
    {
        result.push_back(toJson(a));
    }
    respondJson(result, res);
}
