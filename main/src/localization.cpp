#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_key_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, static_cast<size_t>(count))).parent_path();
        }
        return fs::current_path();
    }

    // The tables are not loaded yet at this point, so this warning stays in English.
    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        auto file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") { // Avoid infinite recursion
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                return load_strings("en", base_dir);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = line.substr(0, pos);
                std::string value = line.substr(pos + 1);
                translations[key] = value;
            }
        }
        return true;
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }

    translations.clear();

    const char* dir_env = getenv("TREESUM_L10N_DIR");
    if (dir_env && *dir_env) {
        L10N_DIR = dir_env;
    } else {
        fs::path relative_l10n_dir = get_executable_dir() / ".." / "l10n"; // Build tree layout
        if (fs::exists(relative_l10n_dir) && fs::is_directory(relative_l10n_dir)) {
            L10N_DIR = relative_l10n_dir;
        }
    }

    load_strings(lang, L10N_DIR);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    // Worker threads can get here on their error paths.
    std::lock_guard<std::mutex> lock(missing_key_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
