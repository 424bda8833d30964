#pragma once
#include <json/json.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "PathPolicy.hpp"

// Tool surface shared by the stdio and HTTP servers: describes the split, merge and
// inspect_manifest tools and runs them on FileSplitterMerger.
class SplitMergeController {
public:
    explicit SplitMergeController(std::uint64_t defaultChunkSizeMb = 10);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    Json::Value listTools() const;

    // Call tool by name. The optional progress callback receives {"operation", "progress"}
    // objects while chunks are written. On failure the returned value carries "__error__"
    // with the message of the underlying error.
    Json::Value callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress = nullptr);

    void setAllowedPaths(const std::vector<std::string>& paths);
    void setDefaultChunkSizeMb(std::uint64_t chunkSizeMb);

private:
    Json::Value runSplit(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress);
    Json::Value runMerge(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress);
    Json::Value runInspect(const Json::Value& arguments);

    PathPolicy policy_;
    std::uint64_t defaultChunkSizeMb_;
};
