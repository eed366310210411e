#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <mw/error.hpp>
#include <spdlog/spdlog.h>

#include "action_sink.hpp"
#include "app.hpp"
#include "config.hpp"
#include "database.hpp"
#include "ledger.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("karma", "Reputation-weighted content ledger");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value("karma.yaml"))
        ("o,owner", "Identity of the owner, overrides the config file",
         cxxopts::value<uint64_t>())
        ("h,help", "Print this message.");

    std::string config_file;
    std::optional<uint64_t> owner_override;
    try
    {
        auto opts = cmd_options.parse(argc, argv);
        if(opts.count("help"))
        {
            std::cout << cmd_options.help() << std::endl;
            return 0;
        }
        config_file = opts["config"].as<std::string>();
        if(opts.count("owner"))
        {
            owner_override = opts["owner"].as<uint64_t>();
        }
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Config& config = Config::get();
    try
    {
        config.load(config_file);
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if(owner_override.has_value())
    {
        config.owner = *owner_override;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto db = std::make_unique<Database>(config.db_path);
    if(auto res = db->init(); !res)
    {
        spdlog::error("Failed to open database {}: {}", config.db_path,
                      mw::errorMsg(res.error()));
        return 2;
    }
    // The ledger lives in memory only, so a new instance must start
    // with an empty action log.
    auto last_seq = db->lastActionSeq();
    if(!last_seq)
    {
        spdlog::error("Failed to read action log: {}",
                      mw::errorMsg(last_seq.error()));
        return 2;
    }
    if(*last_seq != 0)
    {
        spdlog::error("Action log {} already has {} actions. Use a new "
                      "db_path for a new ledger instance.", config.db_path,
                      *last_seq);
        return 2;
    }

    Ledger ledger(config.owner);
    ledger.addSink(std::make_unique<LogActionSink>());
    ledger.addSink(std::make_unique<DatabaseActionSink>(*db));

    App app(ledger, db.get(), config.listen_address, config.port);
    if(auto res = app.start(); !res)
    {
        spdlog::error(mw::errorMsg(res.error()));
        return 3;
    }
    app.wait();
    return 0;
}
