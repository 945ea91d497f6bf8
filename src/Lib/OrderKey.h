//
// Ordering of chunk indices and rasterized page names
//

#ifndef DOCCONV_SERVER_ORDERKEY_H
#define DOCCONV_SERVER_ORDERKEY_H

#include <filesystem>
#include <string>
#include <vector>

// Compares two order keys. Keys that parse as non-negative integers compare numerically (so "2" < "10"),
// integers sort before non-integers, and everything else falls back to lexicographic order.
auto orderKeyLess(const std::string& left, const std::string& right) -> bool;

// Extracts the order key from a stored file name by removing the prefix and any extension,
// for example "chunk_10" -> "10" and "page-007.png" -> "007"
auto orderKeyFromName(const std::string& name, const std::string& prefix) -> std::string;

// Sorts file paths by the order key of their file names
void sortByOrderKey(std::vector<std::filesystem::path>& paths, const std::string& prefix);

#endif //DOCCONV_SERVER_ORDERKEY_H
