#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "report.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.algorithms") << std::endl;
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help(get_string("info.positional_help"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("version", get_string("help.version"))
            ("a,algorithm", get_string("help.algorithm"), cxxopts::value<std::string>())
            ("j,jobs", get_string("help.jobs"), cxxopts::value<std::size_t>())
            ("l,leaves", get_string("help.leaves"), cxxopts::value<bool>()->default_value("false"))
            ("plain", get_string("help.plain"), cxxopts::value<bool>()->default_value("false"))
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("files", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"files"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("version")) {
            std::cout << "treesum " << TREESUM_VERSION << std::endl;
            return 0;
        }

        if (result.count("verbose")) {
            set_verbose_mode(result["verbose"].as<bool>());
        }

        if (result.count("config")) {
            set_config_file(result["config"].as<std::string>());
        }
        load_config();

        // Command line wins over the configuration file
        if (result.count("algorithm")) {
            set_hash_algorithm(result["algorithm"].as<std::string>());
        }

        if (result.count("jobs")) {
            set_jobs(result["jobs"].as<std::size_t>());
        }

        if (!result.count("files")) {
            print_usage(options);
            return 1;
        }

        ReportOptions report;
        report.show_leaves = result["leaves"].as<bool>();
        report.show_plain = result["plain"].as<bool>();

        TreeHashOptions hash_options = get_tree_hash_options();
        make_hash_function_factory(hash_options.algorithm);
        log_debug(string_format("debug.options", hash_options.algorithm.c_str(), hash_options.jobs,
                                hash_options.parallel_threshold));

        const auto& files = result["files"].as<std::vector<std::string>>();
        if (print_tree_hashes(files, hash_options, report, std::cout) > 0) {
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const TreesumException& e) {
        log_error(string_format("error.treesum_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
