#include "PathPolicy.hpp"
#include <mutex>
#include <stdexcept>

void PathPolicy::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowed.clear();
    for (const auto& path : paths) {
        try {
            allowed.push_back(std::filesystem::canonical(path).string());
        } catch (const std::filesystem::filesystem_error&) {
            // Skip directories that do not exist
        }
    }
}

std::vector<std::string> PathPolicy::allowedPaths() const {
    std::shared_lock lock(mutex);
    return allowed;
}

bool PathPolicy::isPathAllowed(const std::filesystem::path& path) const {
    std::shared_lock lock(mutex);
    if (allowed.empty()) {
        return true;
    }

    // Output paths may not exist yet, so resolve as far as the filesystem allows
    std::string resolved;
    try {
        resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path)).string();
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }

    for (const auto& dir : allowed) {
        std::string prefix = (!dir.empty() && dir.back() == '/') ? dir : dir + "/";
        if (resolved == dir || resolved.compare(0, prefix.length(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

void PathPolicy::requireAllowed(const std::filesystem::path& path) const {
    if (!isPathAllowed(path)) {
        throw std::runtime_error("Access denied: path not in allowed list: " + path.string());
    }
}
