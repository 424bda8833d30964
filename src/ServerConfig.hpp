#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// Settings read from the "splitmerge" section of config.json.
struct ServerConfig {
    std::vector<std::string> allowedPaths;
    std::uint64_t defaultChunkSizeMb = 10;
    // First entry of drogon's "listeners" array
    int listenPort = 8080;
};

// Config file location: SPLITMERGE_CONFIG when set, otherwise "config.json".
std::string default_config_path();

// Reads path into a ServerConfig. A missing or unparsable file yields the defaults; each
// decision is reported on log.
ServerConfig load_server_config(const std::string& path, std::ostream& log);
