#include <iostream>
#include <string>
#include <sstream>
#include <json/json.h>
#include "ServerConfig.hpp"
#include "SplitMergeController.hpp"

SplitMergeController controller;

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(const Json::Value& id) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["serverInfo"]["name"] = "splitmerge";
    result["serverInfo"]["version"] = "1.0.0";
    writeMessage(controller.createResponse(id, result));
}

void handleListTools(const Json::Value& id) {
    writeMessage(controller.createResponse(id, controller.listTools()));
}

void handleCallTool(const Json::Value& id, const Json::Value& params) {
    // Progress goes out as notifications only when the caller asked for it with a token
    std::function<void(const Json::Value&)> progressCallback;
    if (params.isObject() && params["_meta"].isObject() && params["_meta"].isMember("progressToken")) {
        Json::Value token = params["_meta"]["progressToken"];
        progressCallback = [token](const Json::Value& p) {
            Json::Value notification;
            notification["jsonrpc"] = "2.0";
            notification["method"] = "notifications/progress";
            notification["params"]["progressToken"] = token;
            notification["params"]["progress"] = p["progress"];
            notification["params"]["total"] = 100;
            notification["params"]["message"] = p["operation"];
            writeMessage(notification);
        };
    }
    Json::Value result = controller.callTool(params, progressCallback);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
}

void processRequest(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        std::cerr << "JSON parse error: " << errs << std::endl;
        writeMessage(controller.createError(Json::Value::null, -32700, "Parse error"));
        return;
    }

    if (!request.isObject()) {
        writeMessage(controller.createError(Json::Value::null, -32600, "Invalid Request"));
        return;
    }
    Json::Value id = request["id"];
    try {
        std::string method = request["method"].asString();
        Json::Value params = request["params"];

        if (method == "initialize") {
            handleInitialize(id);
        } else if (method == "tools/list") {
            handleListTools(id);
        } else if (method == "tools/call") {
            handleCallTool(id, params);
        } else if (method == "notifications/initialized") {
            // No response needed for notifications
        } else {
            writeMessage(controller.createError(id, -32601, "Method not found: " + method));
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        writeMessage(controller.createError(id, -32600, std::string("Invalid Request: ") + e.what()));
    }
}

int main(int argc, char* argv[]) {
    std::string configPath = default_config_path();
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
    }

    // stdout carries the protocol, so configuration is logged to stderr
    ServerConfig config = load_server_config(configPath, std::cerr);
    controller.setAllowedPaths(config.allowedPaths);
    controller.setDefaultChunkSizeMb(config.defaultChunkSizeMb);

    std::string line;
    std::cerr << "splitmerge stdio server started" << std::endl;

    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(line);
        }
    }

    return 0;
}
