#include "ServerConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <json/json.h>

std::string default_config_path() {
    const char* env = std::getenv("SPLITMERGE_CONFIG");
    if (env && *env) {
        return env;
    }
    return "config.json";
}

ServerConfig load_server_config(const std::string& path, std::ostream& log) {
    ServerConfig config;
    if (!std::filesystem::exists(path)) {
        log << "No config file at " << path << ", using defaults" << std::endl;
        return config;
    }

    std::ifstream configFile(path);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        log << "Failed to parse " << path << ": " << errs << std::endl;
        return config;
    }
    log << "Config file parsed successfully" << std::endl;

    const Json::Value& listeners = root["listeners"];
    if (listeners.isArray() && !listeners.empty() && listeners[0].isMember("port")) {
        config.listenPort = listeners[0]["port"].asInt();
    }

    if (!root.isMember("splitmerge")) {
        log << "No 'splitmerge' section in config" << std::endl;
        return config;
    }
    const Json::Value& section = root["splitmerge"];

    if (section.isMember("allowed_paths") && section["allowed_paths"].isArray()) {
        for (const auto& entry : section["allowed_paths"]) {
            config.allowedPaths.push_back(entry.asString());
            log << "  - Adding allowed path: " << entry.asString() << std::endl;
        }
    } else {
        log << "No 'allowed_paths' key in splitmerge config" << std::endl;
    }

    if (section.isMember("default_chunk_size_mb")) {
        const Json::Value& size = section["default_chunk_size_mb"];
        if (size.isUInt64() && size.asUInt64() > 0) {
            config.defaultChunkSizeMb = size.asUInt64();
        } else {
            log << "Ignoring invalid default_chunk_size_mb, keeping " << config.defaultChunkSizeMb << std::endl;
        }
    }
    log << "Default chunk size: " << config.defaultChunkSizeMb << " MB" << std::endl;
    return config;
}
