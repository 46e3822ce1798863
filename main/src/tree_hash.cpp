#include "tree_hash.hpp"

#include "leaf_hasher.hpp"
#include "tree_reducer.hpp"

namespace fs = std::filesystem;

TreeHashResult compute_tree_hash_result(LineReader& reader, const TreeHashOptions& options) {
    // Resolve the algorithm before touching the input.
    HashFunctionFactory factory = make_hash_function_factory(options.algorithm);
    auto hasher = factory();

    TreeHashResult result;
    result.leaves = compute_leaf_hashes(reader, *hasher);
    result.depth = tree_depth(result.leaves.size());
    if (options.jobs > 1) {
        result.root = compute_tree_root(result.leaves, factory, options.jobs, options.parallel_threshold);
    } else {
        result.root = compute_tree_root(result.leaves, *hasher);
    }
    return result;
}

Digest compute_tree_hash(LineReader& reader, const TreeHashOptions& options) {
    return compute_tree_hash_result(reader, options).root;
}

Digest compute_tree_hash(const fs::path& path, const TreeHashOptions& options) {
    make_hash_function_factory(options.algorithm); // report a bad algorithm before a bad path
    LineReader reader(path);
    return compute_tree_hash(reader, options);
}

Digest compute_tree_hash(const fs::path& path) {
    return compute_tree_hash(path, TreeHashOptions{});
}
