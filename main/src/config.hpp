#pragma once

#include "tree_hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path CONFIG_FILE;
extern std::filesystem::path L10N_DIR;

// Functions
void set_config_file(const std::filesystem::path& config_file);

// Reads CONFIG_FILE (key=value lines, '#' comments).
// A missing default file is fine; a missing file chosen with set_config_file() is not.
// Throws TreesumException on unreadable files and malformed values.
void load_config();

// Restores the built-in defaults, including CONFIG_FILE.
void reset_config();

void set_hash_algorithm(const std::string& algorithm);
const std::string& get_hash_algorithm();
// Throw TreesumException for 0, and for jobs above MAX_JOBS.
void set_jobs(std::size_t jobs);
std::size_t get_jobs();
void set_parallel_threshold(std::size_t threshold);
std::size_t get_parallel_threshold();

TreeHashOptions get_tree_hash_options();
