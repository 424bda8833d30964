#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

// Input file or manifest absent when an operation starts.
class NotFoundError : public std::runtime_error {
public:
    NotFoundError(const std::string& message, const std::filesystem::path& path)
        : std::runtime_error(message), path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// A chunk listed by the manifest is not on disk; path() is the exact expected location.
class MissingChunkError : public std::runtime_error {
public:
    explicit MissingChunkError(const std::filesystem::path& path)
        : std::runtime_error("Chunk file missing: " + path.string()), path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class ManifestParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
