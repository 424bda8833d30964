#pragma once
#include <cstddef>
#include <string>

// Chunk file name for a 1-based index: "<base>.part001". The index is padded to three
// digits and widens past 999 ("<base>.part1000").
std::string chunk_file_name(const std::string& base_name, std::size_t index);

std::string manifest_file_name(const std::string& base_name);

// Name used for a merge when no output file is given.
std::string merged_file_name(const std::string& original_name);
