#pragma once

#include "digest.hpp"
#include "hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Reads a file line by line over a POSIX descriptor.
//
// Lines are split on '\n'. One '\r' directly before the terminator (or at
// end of file) is dropped, so "\r\n" and "\n" produce the same line. Text
// after the last '\n' forms a final line only if it is non-empty.
// Terminators are never part of the returned line.
class LineReader {
public:
    // Opens and owns the file. Throws FileAccessError.
    explicit LineReader(const std::filesystem::path& path);
    // Borrows an already open descriptor (e.g. STDIN_FILENO); it is not closed.
    LineReader(int fd, std::string display_name);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Stores the next line in `line`. Returns false at end of input.
    // Throws FileAccessError if a read fails.
    bool next_line(std::string& line);

    // Every byte read from now on, terminators included, is also fed to
    // `hasher`. The caller resets and finalizes it.
    void set_raw_hasher(HashFunction* hasher) { raw_hasher_ = hasher; }

    const std::string& name() const { return name_; }
    std::size_t lines_read() const { return lines_read_; }

private:
    bool fill_buffer();

    int fd_ = -1;
    bool owns_fd_ = false;
    bool eof_ = false;
    std::string name_;
    HashFunction* raw_hasher_ = nullptr;
    std::vector<char> buffer_;
    std::size_t pos_ = 0;
    std::size_t end_ = 0;
    std::size_t lines_read_ = 0;
};

// Hashes every line independently, in file order.
// A file without lines yields exactly one digest: the hash of zero bytes.
std::vector<Digest> compute_leaf_hashes(LineReader& reader, HashFunction& hasher);
std::vector<Digest> compute_leaf_hashes(const std::filesystem::path& path, HashFunction& hasher);
