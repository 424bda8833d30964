#include "SplitMergeController.hpp"
#include "ChunkNaming.hpp"
#include "FileSplitterMerger.hpp"
#include "Manifest.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> optionalPath(const Json::Value& arguments, const char* key) {
    if (!arguments.isMember(key) || arguments[key].isNull()) return std::nullopt;
    std::string value = arguments[key].asString();
    if (value.empty()) return std::nullopt;
    return fs::path(value);
}

fs::path requiredPath(const Json::Value& arguments, const char* key) {
    auto value = optionalPath(arguments, key);
    if (!value) {
        throw std::invalid_argument(std::string("Missing required argument: ") + key);
    }
    return *value;
}

FileSplitterMerger::ProgressCallback forwardProgress(const std::string& operation,
                                                     const std::function<void(const Json::Value&)>& progress) {
    if (!progress) return nullptr;
    return [operation, progress](double percent) {
        Json::Value p;
        p["operation"] = operation;
        p["progress"] = percent;
        progress(p);
    };
}

} // namespace

SplitMergeController::SplitMergeController(std::uint64_t defaultChunkSizeMb)
    : defaultChunkSizeMb_(defaultChunkSizeMb) {
}

Json::Value SplitMergeController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value SplitMergeController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value SplitMergeController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value splitTool;
    splitTool["name"] = "split";
    splitTool["description"] = "Split a file into fixed-size <name>.partNNN chunks and write a <name>.manifest next to them";
    splitTool["inputSchema"]["type"] = "object";
    splitTool["inputSchema"]["properties"]["input_file"]["type"] = "string";
    splitTool["inputSchema"]["properties"]["input_file"]["description"] = "File to split";
    splitTool["inputSchema"]["properties"]["output_dir"]["type"] = "string";
    splitTool["inputSchema"]["properties"]["output_dir"]["description"] = "Directory for chunks and manifest (default: the input file's directory; created if absent)";
    splitTool["inputSchema"]["properties"]["chunk_size_mb"]["type"] = "integer";
    splitTool["inputSchema"]["properties"]["chunk_size_mb"]["minimum"] = 1;
    splitTool["inputSchema"]["properties"]["chunk_size_mb"]["description"] = "Chunk size in MB";
    splitTool["inputSchema"]["properties"]["chunk_size_mb"]["default"] = (Json::UInt64)defaultChunkSizeMb_;
    splitTool["inputSchema"]["required"].append("input_file");
    tools.append(splitTool);

    Json::Value mergeTool;
    mergeTool["name"] = "merge";
    mergeTool["description"] = "Concatenate the chunks listed by a manifest back into a single file";
    mergeTool["inputSchema"]["type"] = "object";
    mergeTool["inputSchema"]["properties"]["manifest_file"]["type"] = "string";
    mergeTool["inputSchema"]["properties"]["manifest_file"]["description"] = "Manifest written by split; chunks are looked up in its directory";
    mergeTool["inputSchema"]["properties"]["output_file"]["type"] = "string";
    mergeTool["inputSchema"]["properties"]["output_file"]["description"] = "Path of the merged file (default: merged_<original_file> next to the manifest)";
    mergeTool["inputSchema"]["required"].append("manifest_file");
    tools.append(mergeTool);

    Json::Value inspectTool;
    inspectTool["name"] = "inspect_manifest";
    inspectTool["description"] = "Read a manifest and report its fields and the default merge output path";
    inspectTool["inputSchema"]["type"] = "object";
    inspectTool["inputSchema"]["properties"]["manifest_file"]["type"] = "string";
    inspectTool["inputSchema"]["required"].append("manifest_file");
    tools.append(inspectTool);

    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value SplitMergeController::callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress) {
    Json::Value result;
    if (!params.isObject()) {
        result["__error__"] = "Invalid params: expected an object with 'name' and 'arguments'";
        return result;
    }
    try {
        std::string toolName = params["name"].asString();
        const Json::Value& arguments = params["arguments"];
        if (!arguments.isNull() && !arguments.isObject()) {
            throw std::invalid_argument("Invalid arguments: expected an object");
        }
        if (toolName == "split") {
            return runSplit(arguments, progress);
        } else if (toolName == "merge") {
            return runMerge(arguments, progress);
        } else if (toolName == "inspect_manifest") {
            return runInspect(arguments);
        }
        result["__error__"] = std::string("Unknown tool: ") + toolName;
        return result;
    } catch (const std::exception& e) {
        result["__error__"] = e.what();
        return result;
    }
}

Json::Value SplitMergeController::runSplit(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress) {
    fs::path inputFile = requiredPath(arguments, "input_file");
    std::optional<fs::path> outputDir = optionalPath(arguments, "output_dir");

    std::uint64_t chunkSizeMb = defaultChunkSizeMb_;
    if (arguments.isMember("chunk_size_mb")) {
        const Json::Value& size = arguments["chunk_size_mb"];
        if (!size.isUInt64() || size.asUInt64() == 0) {
            throw std::invalid_argument("chunk_size_mb must be a positive integer");
        }
        chunkSizeMb = size.asUInt64();
    }

    policy_.requireAllowed(inputFile);
    fs::path targetDir = outputDir ? *outputDir : containing_directory(inputFile);
    policy_.requireAllowed(targetDir);

    auto splitter = FileSplitterMerger::withChunkSizeMb(chunkSizeMb);
    auto chunks = splitter.split(inputFile, outputDir, forwardProgress("split", progress));
    fs::path manifestPath = targetDir / manifest_file_name(inputFile.filename().string());

    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "File split complete!\n\nChunks: " + std::to_string(chunks.size()) +
        "\nOutput directory: " + targetDir.string() + "\nManifest: " + manifestPath.string();
    result["structuredContent"]["chunks"] = Json::Value(Json::arrayValue);
    for (const auto& chunk : chunks) {
        result["structuredContent"]["chunks"].append(chunk.string());
    }
    result["structuredContent"]["manifest"] = manifestPath.string();
    result["structuredContent"]["chunk_size_bytes"] = (Json::UInt64)splitter.chunkSize();
    return result;
}

Json::Value SplitMergeController::runMerge(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress) {
    fs::path manifestFile = requiredPath(arguments, "manifest_file");
    std::optional<fs::path> outputFile = optionalPath(arguments, "output_file");

    policy_.requireAllowed(manifestFile);
    policy_.requireAllowed(outputFile ? *outputFile : containing_directory(manifestFile));

    FileSplitterMerger merger;
    fs::path merged = merger.merge(manifestFile, outputFile, forwardProgress("merge", progress));

    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "Files merged successfully!\n\nOutput file: " + merged.string();
    result["structuredContent"]["output_file"] = merged.string();
    return result;
}

Json::Value SplitMergeController::runInspect(const Json::Value& arguments) {
    fs::path manifestFile = requiredPath(arguments, "manifest_file");
    policy_.requireAllowed(manifestFile);

    Manifest manifest = read_manifest(manifestFile);
    fs::path defaultOutput = containing_directory(manifestFile) / merged_file_name(manifest.originalFile);

    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "original_file: " + manifest.originalFile +
        "\ntotal_chunks: " + std::to_string(manifest.totalChunks) +
        "\nchunk_size_bytes: " + std::to_string(manifest.chunkSizeBytes) +
        "\ndefault_output_file: " + defaultOutput.string();
    result["structuredContent"]["original_file"] = manifest.originalFile;
    result["structuredContent"]["total_chunks"] = (Json::UInt64)manifest.totalChunks;
    result["structuredContent"]["chunk_size_bytes"] = (Json::UInt64)manifest.chunkSizeBytes;
    result["structuredContent"]["default_output_file"] = defaultOutput.string();
    return result;
}

void SplitMergeController::setAllowedPaths(const std::vector<std::string>& paths) {
    policy_.setAllowedPaths(paths);
}

void SplitMergeController::setDefaultChunkSizeMb(std::uint64_t chunkSizeMb) {
    defaultChunkSizeMb_ = chunkSizeMb;
}
