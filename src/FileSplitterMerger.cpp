#include "FileSplitterMerger.hpp"
#include "ChunkNaming.hpp"
#include "Manifest.hpp"
#include "MemorySegment.hpp"
#include "SplitMergeErrors.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <string>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::ofstream openForWrite(const fs::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out) {
        throw fs::filesystem_error("Cannot create file", path, std::error_code(errno, std::generic_category()));
    }
    return out;
}

void writeBytes(std::ofstream& out, const fs::path& path, const char* data, std::uint64_t size) {
    if (size > 0) {
        out.write(data, static_cast<std::streamsize>(size));
    }
    if (!out) {
        throw fs::filesystem_error("Write failed", path, std::error_code(errno, std::generic_category()));
    }
}

void reportProgress(const FileSplitterMerger::ProgressCallback& onProgress, std::uint64_t done, std::uint64_t total) {
    if (!onProgress || total == 0) return;
    double percent = static_cast<double>(done) / static_cast<double>(total) * 100.0;
    onProgress(std::min(percent, 100.0));
}

} // namespace

fs::path containing_directory(const fs::path& path) {
    fs::path parent = path.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

FileSplitterMerger::FileSplitterMerger(std::uint64_t chunkSizeBytes)
    : chunkSize_(chunkSizeBytes) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be a positive number of bytes");
    }
}

FileSplitterMerger FileSplitterMerger::withChunkSizeMb(std::uint64_t chunkSizeMb) {
    const std::uint64_t bytesPerMb = 1024 * 1024;
    if (chunkSizeMb > std::numeric_limits<std::uint64_t>::max() / bytesPerMb) {
        throw std::invalid_argument("Chunk size too large: " + std::to_string(chunkSizeMb) + " MB");
    }
    return FileSplitterMerger(chunkSizeMb * 1024 * 1024);
}

std::vector<fs::path> FileSplitterMerger::split(const fs::path& inputFile,
                                                const std::optional<fs::path>& outputDir,
                                                const ProgressCallback& onProgress) const {
    if (!fs::is_regular_file(inputFile)) {
        throw NotFoundError("File not found: " + inputFile.string(), inputFile);
    }

    fs::path targetDir;
    if (!outputDir || outputDir->empty()) {
        targetDir = containing_directory(inputFile);
    } else {
        targetDir = *outputDir;
        fs::create_directories(targetDir);
    }

    const std::string baseName = inputFile.filename().string();
    MemorySegment input(inputFile);
    const std::uint64_t totalSize = input.size();

    std::vector<fs::path> chunkFiles;
    std::uint64_t bytesProcessed = 0;
    std::size_t chunkNum = 0;
    while (bytesProcessed < totalSize) {
        const std::uint64_t blockSize = std::min(chunkSize_, totalSize - bytesProcessed);
        ++chunkNum;
        fs::path chunkPath = targetDir / chunk_file_name(baseName, chunkNum);
        {
            std::ofstream out = openForWrite(chunkPath);
            writeBytes(out, chunkPath, input.data() + bytesProcessed, blockSize);
        }
        chunkFiles.push_back(chunkPath);

        bytesProcessed += blockSize;
        reportProgress(onProgress, bytesProcessed, totalSize);
    }

    Manifest manifest;
    manifest.originalFile = baseName;
    manifest.totalChunks = chunkNum;
    manifest.chunkSizeBytes = chunkSize_;
    write_manifest(targetDir / manifest_file_name(baseName), manifest);

    return chunkFiles;
}

fs::path FileSplitterMerger::merge(const fs::path& manifestFile,
                                   const std::optional<fs::path>& outputFile,
                                   const ProgressCallback& onProgress) const {
    const Manifest manifest = read_manifest(manifestFile);
    const fs::path chunkDir = containing_directory(manifestFile);

    fs::path target = (outputFile && !outputFile->empty())
        ? *outputFile
        : chunkDir / merged_file_name(manifest.originalFile);

    // Expected size only drives progress; absent chunks are reported in the main pass.
    std::uint64_t totalSize = 0;
    for (std::uint64_t i = 1; i <= manifest.totalChunks; ++i) {
        fs::path chunkPath = chunkDir / chunk_file_name(manifest.originalFile, i);
        std::error_code ec;
        if (fs::is_regular_file(chunkPath, ec)) {
            totalSize += fs::file_size(chunkPath);
        }
    }

    std::ofstream out = openForWrite(target);
    std::uint64_t bytesProcessed = 0;
    for (std::uint64_t i = 1; i <= manifest.totalChunks; ++i) {
        fs::path chunkPath = chunkDir / chunk_file_name(manifest.originalFile, i);
        if (!fs::exists(chunkPath)) {
            throw MissingChunkError(chunkPath);
        }
        MemorySegment chunk(chunkPath);
        writeBytes(out, target, chunk.data(), chunk.size());

        bytesProcessed += chunk.size();
        reportProgress(onProgress, bytesProcessed, totalSize);
    }
    out.flush();
    if (!out) {
        throw fs::filesystem_error("Write failed", target, std::error_code(errno, std::generic_category()));
    }
    return target;
}
