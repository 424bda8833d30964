#include <drogon/drogon.h>
#include <json/json.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "SSEBroadcaster.hpp"
#include "ServerConfig.hpp"
#include "SplitMergeController.hpp"

SplitMergeController controller;
SSEBroadcaster broadcaster;

void sendNotification(const std::string& method, const Json::Value& params = Json::Value()) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    broadcaster.broadcast(method, Json::writeString(writer, notification));
}

void handleInitialize(const Json::Value& id, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["streaming"] = true;
    result["serverInfo"]["name"] = "splitmerge-stream";
    result["serverInfo"]["version"] = "1.0.0";

    sendResponse(controller.createResponse(id, result));
}

void handleListTools(const Json::Value& id, std::function<void(const Json::Value&)> sendResponse) {
    sendResponse(controller.createResponse(id, controller.listTools()));
}

// Runs the tool on the handler thread; progress reaches /mcp/events subscribers as
// notifications/progress keyed by the request's progress token (or its id).
void handleCallTool(const Json::Value& id, const Json::Value& params, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value token = id;
    if (params.isObject() && params["_meta"].isObject() && params["_meta"].isMember("progressToken")) {
        token = params["_meta"]["progressToken"];
    }
    auto progressCb = [token](const Json::Value& p) {
        Json::Value progress;
        progress["progressToken"] = token;
        progress["progress"] = p["progress"];
        progress["total"] = 100;
        progress["message"] = p["operation"];
        sendNotification("notifications/progress", progress);
    };
    Json::Value result = controller.callTool(params, progressCb);
    if (result.isMember("__error__")) {
        sendResponse(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    sendResponse(controller.createResponse(id, result));
}

void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller.createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    if (!json->isObject()) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller.createError(Json::Value::null, -32600, "Invalid Request"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];
    Json::Value params = (*json)["params"];

    auto sendResponse = [callback](const Json::Value& response) {
        callback(drogon::HttpResponse::newHttpJsonResponse(response));
    };

    if (method == "initialize") {
        handleInitialize(id, sendResponse);
    } else if (method == "tools/list") {
        handleListTools(id, sendResponse);
    } else if (method == "tools/call") {
        handleCallTool(id, params, sendResponse);
    } else if (method == "notifications/initialized") {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
    } else {
        sendResponse(controller.createError(id, -32601, "Method not found: " + method));
    }
}

// SSE endpoint: each connection subscribes to the broadcaster until its stream closes
void handleSSE(const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [](drogon::ResponseStreamPtr stream) {
            std::shared_ptr<drogon::ResponseStream> shared(std::move(stream));
            if (!shared->send("data: {\"type\":\"connected\"}\n\n")) {
                return;
            }
            broadcaster.subscribe([shared](const std::string& event) {
                return shared->send(event);
            });
        },
        true);
    resp->setContentTypeString("text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("Connection", "keep-alive");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = default_config_path();
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
    }

    ServerConfig config = load_server_config(configPath, std::cout);
    controller.setAllowedPaths(config.allowedPaths);
    controller.setDefaultChunkSizeMb(config.defaultChunkSizeMb);
    if (config.allowedPaths.empty()) {
        std::cout << "No path restrictions configured (all paths allowed)" << std::endl;
    } else {
        std::cout << "Configured " << config.allowedPaths.size() << " allowed path(s)" << std::endl;
    }

    // drogon takes its listeners and threads from the same file
    int port = config.listenPort;
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
    } else {
        app().addListener("0.0.0.0", port);
    }

    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    app().registerHandler("/mcp/events",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleSSE(req, std::move(callback));
        },
        {Get});

    // CORS support
    app().registerPreHandlingAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    std::cout << "splitmerge stream server starting on port " << port << std::endl;
    std::cout << "  HTTP endpoint: http://localhost:" << port << "/mcp" << std::endl;
    std::cout << "  SSE endpoint: http://localhost:" << port << "/mcp/events" << std::endl;
    app().run();

    return 0;
}
