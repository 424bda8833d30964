#pragma once
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <vector>

// Restricts tool calls to files under a set of directories. With no directories configured
// every path is allowed.
class PathPolicy {
public:
    void setAllowedPaths(const std::vector<std::string>& paths);
    std::vector<std::string> allowedPaths() const;
    bool isPathAllowed(const std::filesystem::path& path) const;

    // Throws std::runtime_error when path is outside the allowed directories.
    void requireAllowed(const std::filesystem::path& path) const;

private:
    std::vector<std::string> allowed;
    mutable std::shared_mutex mutex;
};
