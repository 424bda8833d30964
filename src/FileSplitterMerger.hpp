#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

// Splits a file into fixed-size "<name>.partNNN" chunks plus a "<name>.manifest", and
// concatenates such chunks back into one file. Both operations are synchronous, single pass,
// and leave partial output on disk when they fail.
class FileSplitterMerger {
public:
    // Receives the percentage of bytes processed, in [0, 100], after each chunk.
    using ProgressCallback = std::function<void(double)>;

    static constexpr std::uint64_t kDefaultChunkSize = 10 * 1024 * 1024;

    // Throws std::invalid_argument for a zero chunk size.
    explicit FileSplitterMerger(std::uint64_t chunkSizeBytes = kDefaultChunkSize);

    // Throws std::invalid_argument when the size in bytes does not fit in 64 bits.
    static FileSplitterMerger withChunkSizeMb(std::uint64_t chunkSizeMb);

    std::uint64_t chunkSize() const noexcept { return chunkSize_; }

    // Writes the chunks of inputFile and its manifest into outputDir (default: the input's
    // directory, created when given and absent). Existing files with the same names are
    // overwritten. Returns the chunk paths in index order; empty for an empty input.
    std::vector<std::filesystem::path> split(const std::filesystem::path& inputFile,
                                             const std::optional<std::filesystem::path>& outputDir = std::nullopt,
                                             const ProgressCallback& onProgress = nullptr) const;

    // Rebuilds the original file from the chunks next to manifestFile. outputFile defaults to
    // "merged_<original_file>" in the manifest's directory. Chunk contents are not verified.
    std::filesystem::path merge(const std::filesystem::path& manifestFile,
                                const std::optional<std::filesystem::path>& outputFile = std::nullopt,
                                const ProgressCallback& onProgress = nullptr) const;

private:
    std::uint64_t chunkSize_;
};

// Directory holding path, "." for a bare file name.
std::filesystem::path containing_directory(const std::filesystem::path& path);
