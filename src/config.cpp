#include "config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace {

std::string readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f) throw std::runtime_error("Cannot open config file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

Config& Config::get()
{
    static Config instance;
    return instance;
}

void Config::load(const std::string& path)
{
    std::string content = readFile(path);
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if(root.has_child("listen_address")) root["listen_address"] >> listen_address;
    if(root.has_child("port")) root["port"] >> port;
    if(root.has_child("data_dir")) root["data_dir"] >> data_dir;
    if(root.has_child("db_path")) root["db_path"] >> db_path;
    if(root.has_child("owner")) root["owner"] >> owner;
    if(root.has_child("log_level")) root["log_level"] >> log_level;
    if(root.has_child("default_batch")) root["default_batch"] >> default_batch;

    if(db_path.empty())
    {
        db_path = (std::filesystem::path(data_dir) / "karma.db").string();
    }
    default_batch = std::clamp<uint64_t>(default_batch, 1, MAX_BATCH);
}
