#pragma once

#include "digest.hpp"
#include "hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

class LineReader;

struct TreeHashOptions {
    std::string algorithm{DEFAULT_HASH_ALGORITHM};
    std::size_t jobs = 1;
    // Minimum number of pairs in a level before it is split across threads
    std::size_t parallel_threshold = 4096;
};

struct TreeHashResult {
    Digest root{};
    LeafSequence leaves;
    std::size_t depth = 0;
};

// Tree hash of a text file: the configured 32-byte digest of every line,
// folded pairwise into one digest.
// Throws FileAccessError or HashAlgorithmUnavailable; never returns a partial result.
Digest compute_tree_hash(const std::filesystem::path& path);
Digest compute_tree_hash(const std::filesystem::path& path, const TreeHashOptions& options);
Digest compute_tree_hash(LineReader& reader, const TreeHashOptions& options);

// Same computation, keeping the leaf hashes around for reporting.
TreeHashResult compute_tree_hash_result(LineReader& reader, const TreeHashOptions& options);
