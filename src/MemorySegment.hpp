#pragma once
#include <cstddef>
#include <filesystem>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only view of a whole file. Zero-length files are not mapped; data() is then null
// and size() is 0.
class MemorySegment {
public:
    explicit MemorySegment(const std::filesystem::path& path);

    MemorySegment(const MemorySegment&) = delete;
    MemorySegment& operator=(const MemorySegment&) = delete;

    size_t size() const;
    const char* data() const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t segmentSize;
};
