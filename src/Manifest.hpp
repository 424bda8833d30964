#pragma once
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

// Metadata written next to the chunks of a split. One "key: value" pair per line, keys in
// the order original_file, total_chunks, chunk_size_bytes. Values are not escaped, so a base
// name containing ": " or a newline cannot be represented.
struct Manifest {
    std::string originalFile;
    std::uint64_t totalChunks = 0;
    std::uint64_t chunkSizeBytes = 0;
};

void write_manifest(std::ostream& out, const Manifest& manifest);
void write_manifest(const std::filesystem::path& path, const Manifest& manifest);

// Throws ManifestParseError on a line without ": ", a missing key, a malformed count or an
// original_file that is not a plain file name.
Manifest parse_manifest(std::istream& in);

// Throws NotFoundError when the file does not exist.
Manifest read_manifest(const std::filesystem::path& path);
