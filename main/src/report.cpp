#include "report.hpp"

#include "exception.hpp"
#include "hash.hpp"
#include "leaf_hasher.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <memory>
#include <new>
#include <sstream>

namespace {

void print_result(const std::string& file, const TreeHashResult& result, bool empty_input,
                  const ReportOptions& report, std::ostream& out) {
    if (report.show_leaves) {
        std::size_t line_no = empty_input ? 0 : 1;
        for (const auto& leaf : result.leaves) {
            out << to_hex(leaf) << "  " << file << ":" << line_no++ << "\n";
        }
    }
    out << to_hex(result.root) << "  " << file << "\n";
}

} // namespace

bool print_tree_hash(const std::string& file, const TreeHashOptions& options,
                     const ReportOptions& report, std::ostream& out) {
    try {
        make_hash_function_factory(options.algorithm);

        std::unique_ptr<LineReader> reader;
        if (file == "-") {
            reader = std::make_unique<LineReader>(STDIN_FILENO, "-");
        } else {
            reader = std::make_unique<LineReader>(file);
        }

        // The flat hash is taken from the same read, so pipes work too.
        std::unique_ptr<EvpHashFunction> plain_hasher;
        if (report.show_plain) {
            plain_hasher = std::make_unique<EvpHashFunction>("sha256");
            plain_hasher->reset();
            reader->set_raw_hasher(plain_hasher.get());
        }

        TreeHashResult result = compute_tree_hash_result(*reader, options);

        std::ostringstream lines;
        print_result(file, result, reader->lines_read() == 0, report, lines);
        if (plain_hasher) {
            lines << to_hex(plain_hasher->finalize()) << "  " << file << " (sha256)\n";
        }

        // Nothing is written unless the whole file succeeded.
        out << lines.str();
        out.flush();
        return true;
    } catch (const TreesumException& e) {
        log_error(string_format("error.file_failed", file.c_str(), e.what()));
        return false;
    } catch (const std::bad_alloc& e) {
        log_error(string_format("error.file_failed", file.c_str(), e.what()));
        return false;
    }
}

std::size_t print_tree_hashes(const std::vector<std::string>& files, const TreeHashOptions& options,
                              const ReportOptions& report, std::ostream& out) {
    std::size_t failures = 0;
    for (const auto& file : files) {
        if (!print_tree_hash(file, options, report, out)) {
            ++failures;
        }
    }
    if (failures > 0) {
        log_warning(string_format("warning.files_failed", failures, files.size()));
    }
    return failures;
}
