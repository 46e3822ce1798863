#pragma once

#include "digest.hpp"
#include "hash.hpp"

#include <cstddef>

// Upper bound for worker threads per level.
inline constexpr std::size_t MAX_JOBS = 256;

// One reduction step: adjacent pairs become hash(left || right), and the
// last digest of an odd-length level is carried into the next level as is.
// The result has ceil(level.size() / 2) elements.
TreeLevel reduce_level(const TreeLevel& level, HashFunction& hasher);

// Same as above, with the pairs split across `jobs` threads (at most
// MAX_JOBS). Each thread gets its own hasher from `factory`. The output is
// identical. Throws TreesumException if a worker cannot be started.
TreeLevel reduce_level(const TreeLevel& level, const HashFunctionFactory& factory, std::size_t jobs);

// Folds the leaves down to the root digest.
// Throws InvalidInputError if `leaves` is empty.
Digest compute_tree_root(const LeafSequence& leaves, HashFunction& hasher);

// Levels with fewer than `parallel_threshold` pairs are reduced on the
// calling thread; larger ones are fanned out over `jobs` threads.
Digest compute_tree_root(const LeafSequence& leaves, const HashFunctionFactory& factory,
                         std::size_t jobs, std::size_t parallel_threshold);

// Number of reduction levels for `leaf_count` leaves: ceil(log2(n)), 0 for n <= 1.
std::size_t tree_depth(std::size_t leaf_count);
