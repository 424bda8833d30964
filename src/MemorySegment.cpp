#include "MemorySegment.hpp"

MemorySegment::MemorySegment(const std::filesystem::path& path)
    : fileMapping(path.c_str(), boost::interprocess::read_only),
      segmentSize(0) {
    // mapped_region rejects an empty mapping
    if (std::filesystem::file_size(path) == 0) {
        return;
    }
    boost::interprocess::mapped_region mapped(fileMapping, boost::interprocess::read_only);
    region.swap(mapped);
    segmentSize = region.get_size();
}

size_t MemorySegment::size() const {
    return segmentSize;
}

const char* MemorySegment::data() const {
    return static_cast<const char*>(region.get_address());
}
