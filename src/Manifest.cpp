#include "Manifest.hpp"
#include "SplitMergeErrors.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>
#include <unordered_map>

namespace {

const char* const kOriginalFileKey = "original_file";
const char* const kTotalChunksKey = "total_chunks";
const char* const kChunkSizeKey = "chunk_size_bytes";
const char* const kSeparator = ": ";

// Values keep their whitespace; only a CRLF line ending is undone
std::string stripCarriageReturn(const std::string& s) {
    if (!s.empty() && s.back() == '\r') return s.substr(0, s.size() - 1);
    return s;
}

// original_file names a file next to the manifest, never a path
const std::string& requirePlainName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        std::filesystem::path(name).filename().string() != name) {
        throw ManifestParseError("Invalid original_file, expected a plain file name: " + name);
    }
    return name;
}

const std::string& requireKey(const std::unordered_map<std::string, std::string>& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        throw ManifestParseError("Manifest is missing required key: " + key);
    }
    return it->second;
}

std::uint64_t parseCount(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ManifestParseError("Invalid value for " + key + ": " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ManifestParseError("Value out of range for " + key + ": " + value);
    }
}

} // namespace

void write_manifest(std::ostream& out, const Manifest& manifest) {
    out << kOriginalFileKey << kSeparator << manifest.originalFile << "\n";
    out << kTotalChunksKey << kSeparator << manifest.totalChunks << "\n";
    out << kChunkSizeKey << kSeparator << manifest.chunkSizeBytes << "\n";
}

void write_manifest(const std::filesystem::path& path, const Manifest& manifest) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::filesystem::filesystem_error("Cannot create manifest file", path,
                                                std::error_code(errno, std::generic_category()));
    }
    write_manifest(out, manifest);
    out.flush();
    if (!out) {
        throw std::filesystem::filesystem_error("Failed writing manifest file", path,
                                                std::error_code(errno, std::generic_category()));
    }
}

Manifest parse_manifest(std::istream& in) {
    std::unordered_map<std::string, std::string> fields;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string stripped = stripCarriageReturn(line);
        auto pos = stripped.find(kSeparator);
        if (pos == std::string::npos) {
            throw ManifestParseError("Malformed manifest line " + std::to_string(lineNo) + ": " + stripped);
        }
        fields[stripped.substr(0, pos)] = stripped.substr(pos + 2);
    }

    Manifest manifest;
    manifest.originalFile = requirePlainName(requireKey(fields, kOriginalFileKey));
    manifest.totalChunks = parseCount(kTotalChunksKey, requireKey(fields, kTotalChunksKey));
    manifest.chunkSizeBytes = parseCount(kChunkSizeKey, requireKey(fields, kChunkSizeKey));
    return manifest;
}

Manifest read_manifest(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw NotFoundError("Manifest file not found: " + path.string(), path);
    }
    std::ifstream in(path);
    if (!in) {
        throw std::filesystem::filesystem_error("Cannot open manifest file", path,
                                                std::error_code(errno, std::generic_category()));
    }
    return parse_manifest(in);
}
