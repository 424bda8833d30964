#include <iostream>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/ChunkNaming.hpp"
#include "../src/FileSplitterMerger.hpp"
#include "../src/Manifest.hpp"
#include "../src/SplitMergeErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static std::string makeContent(size_t size) {
    std::string content(size, '\0');
    unsigned int state = 12345u;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        content[i] = static_cast<char>((state >> 16) & 0xff);
    }
    return content;
}

static void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

static std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

static bool progressIsWellFormed(const std::vector<double>& values) {
    double last = 0.0;
    for (double v : values) {
        if (v < 0.0 || v > 100.0 || v < last) return false;
        last = v;
    }
    return true;
}

static size_t countChunkFiles(const fs::path& dir, const std::string& baseName) {
    size_t count = 0;
    std::string prefix = baseName + ".part";
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0) ++count;
    }
    return count;
}

int main() {
    auto tmpDir = fs::temp_directory_path() / "splitmerge_core_test";
    try {
        fs::remove_all(tmpDir);
        fs::create_directories(tmpDir);

        // Round trips: empty, smaller than a chunk, exact multiple, with remainder
        const std::uint64_t chunkSize = 1000;
        FileSplitterMerger splitter(chunkSize);
        ASSERT_TRUE(splitter.chunkSize() == chunkSize);
        const size_t sizes[] = {0, 1, 999, 1000, 3000, 3001, 4567};
        for (size_t size : sizes) {
            std::string name = "input_" + std::to_string(size) + ".bin";
            fs::path input = tmpDir / name;
            fs::path outDir = tmpDir / ("out_" + std::to_string(size));
            std::string content = makeContent(size);
            writeFile(input, content);

            std::vector<double> splitProgress;
            auto chunks = splitter.split(input, outDir, [&splitProgress](double p) { splitProgress.push_back(p); });

            size_t expectedChunks = (size + chunkSize - 1) / chunkSize;
            ASSERT_TRUE(chunks.size() == expectedChunks);
            ASSERT_TRUE(countChunkFiles(outDir, name) == expectedChunks);
            for (size_t i = 0; i < chunks.size(); ++i) {
                ASSERT_TRUE(chunks[i] == outDir / chunk_file_name(name, i + 1));
                ASSERT_TRUE(fs::file_size(chunks[i]) > 0);
                size_t expectedSize = (i + 1 < chunks.size()) ? chunkSize : size - i * chunkSize;
                ASSERT_TRUE(fs::file_size(chunks[i]) == expectedSize);
            }

            Manifest manifest = read_manifest(outDir / manifest_file_name(name));
            ASSERT_TRUE(manifest.originalFile == name);
            ASSERT_TRUE(manifest.totalChunks == expectedChunks);
            ASSERT_TRUE(manifest.chunkSizeBytes == chunkSize);

            ASSERT_TRUE(splitProgress.size() == expectedChunks);
            ASSERT_TRUE(progressIsWellFormed(splitProgress));
            if (!splitProgress.empty()) {
                ASSERT_TRUE(std::fabs(splitProgress.back() - 100.0) < 1e-9);
            }

            std::vector<double> mergeProgress;
            fs::path merged = splitter.merge(outDir / manifest_file_name(name), std::nullopt,
                                             [&mergeProgress](double p) { mergeProgress.push_back(p); });
            ASSERT_TRUE(merged == outDir / merged_file_name(name));
            ASSERT_TRUE(fs::exists(merged));
            ASSERT_TRUE(readFile(merged) == content);
            ASSERT_TRUE(mergeProgress.size() == expectedChunks);
            ASSERT_TRUE(progressIsWellFormed(mergeProgress));

            // Inputs are left untouched
            ASSERT_TRUE(readFile(input) == content);
        }

        // Empty input: manifest with zero chunks, empty merge output, no progress calls
        {
            fs::path outDir = tmpDir / "out_0";
            std::ifstream manifestText(outDir / "input_0.bin.manifest");
            std::string text((std::istreambuf_iterator<char>(manifestText)), std::istreambuf_iterator<char>());
            ASSERT_TRUE(text == "original_file: input_0.bin\ntotal_chunks: 0\nchunk_size_bytes: 1000\n");
            ASSERT_TRUE(fs::file_size(outDir / "merged_input_0.bin") == 0);
        }

        // Default output directory is the input's own directory
        {
            fs::path dir = tmpDir / "same_dir";
            fs::create_directories(dir);
            fs::path input = dir / "doc.txt";
            std::string content = makeContent(2500);
            writeFile(input, content);
            auto chunks = splitter.split(input);
            ASSERT_TRUE(chunks.size() == 3);
            ASSERT_TRUE(fs::exists(dir / "doc.txt.part001"));
            ASSERT_TRUE(fs::exists(dir / "doc.txt.part003"));
            ASSERT_TRUE(fs::exists(dir / "doc.txt.manifest"));

            // Explicit output file
            fs::path target = tmpDir / "explicit_output.txt";
            ASSERT_TRUE(splitter.merge(dir / "doc.txt.manifest", target) == target);
            ASSERT_TRUE(readFile(target) == content);
        }

        // Missing output directories are created, parents included
        {
            fs::path input = tmpDir / "nested.bin";
            writeFile(input, makeContent(10));
            fs::path outDir = tmpDir / "a" / "b" / "c";
            auto chunks = splitter.split(input, outDir);
            ASSERT_TRUE(chunks.size() == 1);
            ASSERT_TRUE(fs::is_directory(outDir));
            ASSERT_TRUE(fs::exists(outDir / "nested.bin.manifest"));
        }

        // Re-running a split into the same directory overwrites and still round-trips
        {
            fs::path input = tmpDir / "again.bin";
            fs::path outDir = tmpDir / "again_out";
            writeFile(input, makeContent(3500));
            splitter.split(input, outDir);
            splitter.split(input, outDir);
            ASSERT_TRUE(readFile(splitter.merge(outDir / "again.bin.manifest")) == makeContent(3500));

            // A shorter rewrite leaves the old fourth chunk behind; the manifest ignores it
            std::string shorter = makeContent(1500);
            writeFile(input, shorter);
            auto chunks = splitter.split(input, outDir);
            ASSERT_TRUE(chunks.size() == 2);
            ASSERT_TRUE(read_manifest(outDir / "again.bin.manifest").totalChunks == 2);
            ASSERT_TRUE(readFile(splitter.merge(outDir / "again.bin.manifest")) == shorter);
        }

        // Deleting any chunk makes merge fail naming that chunk
        {
            fs::path input = tmpDir / "holes.bin";
            fs::path outDir = tmpDir / "holes_out";
            writeFile(input, makeContent(5000));
            for (size_t missing = 1; missing <= 5; ++missing) {
                splitter.split(input, outDir);
                fs::path chunkPath = outDir / chunk_file_name("holes.bin", missing);
                fs::remove(chunkPath);
                bool thrown = false;
                try {
                    splitter.merge(outDir / "holes.bin.manifest");
                } catch (const MissingChunkError& e) {
                    thrown = true;
                    ASSERT_TRUE(e.path() == chunkPath);
                    ASSERT_TRUE(std::string(e.what()) == "Chunk file missing: " + chunkPath.string());
                }
                ASSERT_TRUE(thrown);
            }
        }

        // Chunk contents are not verified: a truncated chunk is merged as-is
        {
            fs::path input = tmpDir / "trunc.bin";
            fs::path outDir = tmpDir / "trunc_out";
            std::string content = makeContent(2500);
            writeFile(input, content);
            splitter.split(input, outDir);
            writeFile(outDir / "trunc.bin.part002", "");
            fs::path merged = splitter.merge(outDir / "trunc.bin.manifest");
            ASSERT_TRUE(readFile(merged) == content.substr(0, 1000) + content.substr(2000));
        }

        // Not-found errors
        {
            bool thrown = false;
            try {
                splitter.split(tmpDir / "does_not_exist.bin");
            } catch (const NotFoundError& e) {
                thrown = true;
                ASSERT_TRUE(std::string(e.what()) == "File not found: " + (tmpDir / "does_not_exist.bin").string());
            }
            ASSERT_TRUE(thrown);

            thrown = false;
            try {
                splitter.split(tmpDir);
            } catch (const NotFoundError&) {
                thrown = true;
            }
            ASSERT_TRUE(thrown);

            thrown = false;
            try {
                splitter.merge(tmpDir / "nothing.manifest");
            } catch (const NotFoundError&) {
                thrown = true;
            }
            ASSERT_TRUE(thrown);
        }

        // Malformed manifest
        {
            fs::path bad = tmpDir / "bad.manifest";
            writeFile(bad, "original_file: x\ntotal_chunks=2\nchunk_size_bytes: 5\n");
            bool thrown = false;
            try {
                splitter.merge(bad);
            } catch (const ManifestParseError&) {
                thrown = true;
            }
            ASSERT_TRUE(thrown);
        }

        // Zero chunk size is rejected
        {
            bool thrown = false;
            try {
                FileSplitterMerger zero(0);
            } catch (const std::invalid_argument&) {
                thrown = true;
            }
            ASSERT_TRUE(thrown);
        }

        // MB sizes whose byte count overflows 64 bits are rejected
        {
            ASSERT_TRUE(FileSplitterMerger::withChunkSizeMb(17592186044415ULL).chunkSize() ==
                        17592186044415ULL * 1024 * 1024);
            bool thrown = false;
            try {
                FileSplitterMerger::withChunkSizeMb(17592186044417ULL);
            } catch (const std::invalid_argument& e) {
                thrown = true;
                ASSERT_TRUE(std::string(e.what()) == "Chunk size too large: 17592186044417 MB");
            }
            ASSERT_TRUE(thrown);
        }

        // Leading and trailing spaces in the file name survive the manifest
        {
            const std::string name = " spaced name ";
            fs::path input = tmpDir / name;
            fs::path outDir = tmpDir / "spaced_out";
            std::string content = makeContent(2500);
            writeFile(input, content);
            splitter.split(input, outDir);
            ASSERT_TRUE(fs::exists(outDir / (name + ".part003")));
            ASSERT_TRUE(read_manifest(outDir / manifest_file_name(name)).originalFile == name);
            fs::path merged = splitter.merge(outDir / manifest_file_name(name));
            ASSERT_TRUE(merged == outDir / ("merged_" + name));
            ASSERT_TRUE(readFile(merged) == content);
        }

        // 25 MB with the default 10 MB chunk size
        {
            FileSplitterMerger defaults;
            ASSERT_TRUE(defaults.chunkSize() == 10485760);
            ASSERT_TRUE(FileSplitterMerger::withChunkSizeMb(10).chunkSize() == 10485760);

            const size_t mib = 1024 * 1024;
            fs::path input = tmpDir / "large.bin";
            fs::path outDir = tmpDir / "large_out";
            std::string content = makeContent(25 * mib);
            writeFile(input, content);

            std::vector<double> progress;
            auto chunks = defaults.split(input, outDir, [&progress](double p) { progress.push_back(p); });
            ASSERT_TRUE(chunks.size() == 3);
            ASSERT_TRUE(fs::file_size(outDir / "large.bin.part001") == 10 * mib);
            ASSERT_TRUE(fs::file_size(outDir / "large.bin.part002") == 10 * mib);
            ASSERT_TRUE(fs::file_size(outDir / "large.bin.part003") == 5 * mib);
            ASSERT_TRUE(progress.size() == 3);
            ASSERT_TRUE(std::fabs(progress[0] - 40.0) < 1e-9);
            ASSERT_TRUE(std::fabs(progress[1] - 80.0) < 1e-9);
            ASSERT_TRUE(std::fabs(progress[2] - 100.0) < 1e-9);

            Manifest manifest = read_manifest(outDir / "large.bin.manifest");
            ASSERT_TRUE(manifest.totalChunks == 3);
            ASSERT_TRUE(manifest.chunkSizeBytes == 10485760);

            fs::path merged = defaults.merge(outDir / "large.bin.manifest");
            ASSERT_TRUE(fs::file_size(merged) == 25 * mib);
            ASSERT_TRUE(readFile(merged) == content);
        }

        fs::remove_all(tmpDir);
    } catch (const std::exception& e) {
        std::cerr << "Exception in test: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All FileSplitterMerger tests passed" << std::endl;
    return 0;
}
