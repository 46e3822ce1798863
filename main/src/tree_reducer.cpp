#include "tree_reducer.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <system_error>
#include <vector>

namespace {

// Fills next[first, last) from the pairs of `level`.
void hash_pairs(const TreeLevel& level, TreeLevel& next, std::size_t first, std::size_t last, HashFunction& hasher) {
    for (std::size_t j = first; j < last; ++j) {
        next[j] = hash_pair(hasher, level[2 * j], level[2 * j + 1]);
    }
}

void carry_forward(const TreeLevel& level, TreeLevel& next) {
    if (level.size() % 2 != 0) {
        next.back() = level.back();
    }
}

void check_not_empty(const TreeLevel& level) {
    if (level.empty()) {
        throw InvalidInputError(get_string("error.empty_leaf_sequence"));
    }
}

} // namespace

TreeLevel reduce_level(const TreeLevel& level, HashFunction& hasher) {
    check_not_empty(level);
    TreeLevel next((level.size() + 1) / 2);
    hash_pairs(level, next, 0, level.size() / 2, hasher);
    carry_forward(level, next);
    return next;
}

TreeLevel reduce_level(const TreeLevel& level, const HashFunctionFactory& factory, std::size_t jobs) {
    check_not_empty(level);
    const std::size_t pairs = level.size() / 2;
    jobs = std::clamp<std::size_t>(jobs, 1, std::clamp<std::size_t>(pairs, 1, MAX_JOBS));

    TreeLevel next((level.size() + 1) / 2);
    if (jobs == 1) {
        auto hasher = factory();
        hash_pairs(level, next, 0, pairs, *hasher);
        carry_forward(level, next);
        return next;
    }

    const std::size_t chunk = (pairs + jobs - 1) / jobs;
    std::vector<std::future<void>> workers;
    workers.reserve(jobs);
    for (std::size_t first = 0; first < pairs; first += chunk) {
        const std::size_t last = std::min(first + chunk, pairs);
        try {
            workers.push_back(std::async(std::launch::async, [&level, &next, &factory, first, last]() {
                auto hasher = factory();
                hash_pairs(level, next, first, last, *hasher);
            }));
        } catch (const std::system_error& e) {
            // Futures already handed out join in their destructors.
            throw TreesumException(string_format("error.thread_start_failed", e.what()));
        }
    }
    // Wait for every worker before rethrowing, the lambdas reference `next`.
    for (auto& worker : workers) {
        worker.wait();
    }
    for (auto& worker : workers) {
        worker.get();
    }

    carry_forward(level, next);
    return next;
}

Digest compute_tree_root(const LeafSequence& leaves, HashFunction& hasher) {
    check_not_empty(leaves);
    log_debug(string_format("debug.reduction_start", leaves.size(), tree_depth(leaves.size())));

    TreeLevel level = leaves;
    while (level.size() > 1) {
        level = reduce_level(level, hasher);
    }
    return level.front();
}

Digest compute_tree_root(const LeafSequence& leaves, const HashFunctionFactory& factory,
                         std::size_t jobs, std::size_t parallel_threshold) {
    check_not_empty(leaves);
    log_debug(string_format("debug.reduction_start", leaves.size(), tree_depth(leaves.size())));

    std::unique_ptr<HashFunction> local_hasher;
    TreeLevel level = leaves;
    while (level.size() > 1) {
        if (jobs > 1 && level.size() / 2 >= parallel_threshold) {
            log_debug(string_format("debug.parallel_level", level.size(), jobs));
            level = reduce_level(level, factory, jobs);
        } else {
            if (!local_hasher) {
                local_hasher = factory();
            }
            level = reduce_level(level, *local_hasher);
        }
    }
    return level.front();
}

std::size_t tree_depth(std::size_t leaf_count) {
    std::size_t depth = 0;
    while (leaf_count > 1) {
        leaf_count = (leaf_count + 1) / 2;
        ++depth;
    }
    return depth;
}
