#include "ChunkNaming.hpp"
#include <iomanip>
#include <sstream>

std::string chunk_file_name(const std::string& base_name, std::size_t index) {
    std::ostringstream ss;
    ss << base_name << ".part" << std::setw(3) << std::setfill('0') << index;
    return ss.str();
}

std::string manifest_file_name(const std::string& base_name) {
    return base_name + ".manifest";
}

std::string merged_file_name(const std::string& original_name) {
    return "merged_" + original_name;
}
