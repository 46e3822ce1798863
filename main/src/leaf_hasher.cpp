#include "leaf_hasher.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace fs = std::filesystem;

namespace {
    constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;
}

LineReader::LineReader(const fs::path& path)
    : owns_fd_(true), name_(path.string()), buffer_(READ_BUFFER_SIZE) {
    fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw FileAccessError(string_format("error.open_file_failed_errno", name_.c_str(), std::strerror(errno)));
    }
}

LineReader::LineReader(int fd, std::string display_name)
    : fd_(fd), owns_fd_(false), name_(std::move(display_name)), buffer_(READ_BUFFER_SIZE) {}

LineReader::~LineReader() {
    if (owns_fd_ && fd_ != -1) {
        if (close(fd_) != 0) {
            log_warning(string_format("warning.close_file_failed", name_.c_str(), std::strerror(errno)));
        }
        fd_ = -1;
    }
}

bool LineReader::fill_buffer() {
    if (eof_) {
        return false;
    }
    ssize_t n;
    do {
        n = read(fd_, buffer_.data(), buffer_.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw FileAccessError(string_format("error.read_file_failed", name_.c_str(), std::strerror(errno)));
    }
    if (n == 0) {
        eof_ = true;
        return false;
    }
    pos_ = 0;
    end_ = static_cast<std::size_t>(n);
    if (raw_hasher_) {
        raw_hasher_->update(reinterpret_cast<const std::uint8_t*>(buffer_.data()), end_);
    }
    return true;
}

bool LineReader::next_line(std::string& line) {
    line.clear();
    bool have_data = false;

    while (true) {
        if (pos_ == end_ && !fill_buffer()) {
            break;
        }
        have_data = true;
        const char* begin = buffer_.data() + pos_;
        const void* newline = std::memchr(begin, '\n', end_ - pos_);
        if (newline) {
            std::size_t len = static_cast<std::size_t>(static_cast<const char*>(newline) - begin);
            line.append(begin, len);
            pos_ += len + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            ++lines_read_;
            return true;
        }
        line.append(begin, end_ - pos_);
        pos_ = end_;
    }

    // Unterminated final line
    if (have_data && !line.empty()) {
        if (line.back() == '\r') {
            line.pop_back();
        }
        ++lines_read_;
        return true;
    }
    return false;
}

std::vector<Digest> compute_leaf_hashes(LineReader& reader, HashFunction& hasher) {
    std::vector<Digest> leaves;
    std::string line;
    while (reader.next_line(line)) {
        leaves.push_back(hash_bytes(hasher, line));
    }

    if (leaves.empty()) {
        log_debug(string_format("debug.empty_input", reader.name().c_str()));
        leaves.push_back(hash_bytes(hasher, nullptr, 0));
        return leaves;
    }

    log_debug(string_format("debug.leaves_computed", leaves.size(), reader.name().c_str()));
    return leaves;
}

std::vector<Digest> compute_leaf_hashes(const fs::path& path, HashFunction& hasher) {
    LineReader reader(path);
    return compute_leaf_hashes(reader, hasher);
}
