#pragma once

#include <cstdint>
#include <string>

#include "types.hpp"

struct Config
{
    std::string listen_address = "127.0.0.1";
    int port = 8080;
    std::string data_dir = ".";
    // Defaults to <data_dir>/karma.db.
    std::string db_path;
    // The deployer. Starts as the only moderator.
    Identity owner = ANONYMOUS;
    std::string log_level = "info";
    // Page size used by the HTTP gateway when a query omits it.
    uint64_t default_batch = 20;

    static Config& get();
    void load(const std::string& path);
};
