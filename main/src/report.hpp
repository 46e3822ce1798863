#pragma once

#include "tree_hash.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

struct ReportOptions {
    bool show_leaves = false;
    bool show_plain = false;
};

// Writes "<hex>  <file>" for one file ("-" is standard input).
// With show_leaves, every leaf is listed first as "<hex>  <file>:<line>";
// the empty-file sentinel is listed as line 0.
// With show_plain, "<hex>  <file> (sha256)" follows with the flat file hash,
// taken from the same read. Output is written only once the file succeeded.
// Errors are logged, not thrown. Returns false if the file failed.
bool print_tree_hash(const std::string& file, const TreeHashOptions& options,
                     const ReportOptions& report, std::ostream& out);

// Returns the number of files that failed.
std::size_t print_tree_hashes(const std::vector<std::string>& files, const TreeHashOptions& options,
                              const ReportOptions& report, std::ostream& out);
