#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "tree_reducer.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = TREESUM_CONF_DIR;
fs::path CONFIG_FILE = fs::path(TREESUM_CONF_DIR) / "treesum.conf";
fs::path L10N_DIR = TREESUM_L10N_DIR;

namespace {
    const TreeHashOptions default_options;

    std::string hash_algorithm = default_options.algorithm;
    std::size_t jobs = default_options.jobs;
    std::size_t parallel_threshold = default_options.parallel_threshold;
    bool config_file_explicit = false;

    std::string trim(const std::string& s) {
        const char* ws = " \t\r";
        size_t begin = s.find_first_not_of(ws);
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(ws);
        return s.substr(begin, end - begin + 1);
    }

    std::size_t parse_count(const std::string& key, const std::string& value, std::size_t min, std::size_t max) {
        errno = 0;
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
        if (value.empty() || value[0] == '-' || *end != '\0' || errno == ERANGE || parsed < min || parsed > max) {
            throw TreesumException(string_format("error.config_invalid_value", key.c_str(), value.c_str()));
        }
        return static_cast<std::size_t>(parsed);
    }
}

void set_config_file(const fs::path& config_file) {
    CONFIG_FILE = config_file;
    config_file_explicit = true;
}

void load_config() {
    std::ifstream file(CONFIG_FILE);
    if (!file.is_open()) {
        if (config_file_explicit) {
            throw TreesumException(string_format("error.open_file_failed", CONFIG_FILE.c_str()));
        }
        return;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            throw TreesumException(string_format("error.config_syntax", CONFIG_FILE.c_str(), line_no));
        }
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (key == "algorithm") {
            if (value.empty()) {
                throw TreesumException(string_format("error.config_invalid_value", key.c_str(), value.c_str()));
            }
            hash_algorithm = value;
        } else if (key == "jobs") {
            jobs = parse_count(key, value, 1, MAX_JOBS);
        } else if (key == "parallel_threshold") {
            parallel_threshold = parse_count(key, value, 1, std::numeric_limits<std::size_t>::max());
        } else {
            log_warning(string_format("warning.config_unknown_key", key.c_str(), CONFIG_FILE.c_str()));
        }
    }
    if (file.bad()) {
        throw TreesumException(string_format("error.read_file_failed", CONFIG_FILE.c_str(), std::strerror(errno)));
    }
    log_debug(string_format("debug.config_loaded", CONFIG_FILE.c_str()));
}

void reset_config() {
    CONFIG_DIR = TREESUM_CONF_DIR;
    CONFIG_FILE = CONFIG_DIR / "treesum.conf";
    config_file_explicit = false;
    hash_algorithm = default_options.algorithm;
    jobs = default_options.jobs;
    parallel_threshold = default_options.parallel_threshold;
}

void set_hash_algorithm(const std::string& algorithm) {
    hash_algorithm = algorithm;
}

const std::string& get_hash_algorithm() {
    return hash_algorithm;
}

void set_jobs(std::size_t value) {
    if (value == 0 || value > MAX_JOBS) {
        throw TreesumException(string_format("error.config_invalid_value", "jobs", std::to_string(value).c_str()));
    }
    jobs = value;
}

std::size_t get_jobs() {
    return jobs;
}

void set_parallel_threshold(std::size_t threshold) {
    if (threshold == 0) {
        throw TreesumException(string_format("error.config_invalid_value", "parallel_threshold", "0"));
    }
    parallel_threshold = threshold;
}

std::size_t get_parallel_threshold() {
    return parallel_threshold;
}

TreeHashOptions get_tree_hash_options() {
    TreeHashOptions options;
    options.algorithm = hash_algorithm;
    options.jobs = jobs;
    options.parallel_threshold = parallel_threshold;
    return options;
}
