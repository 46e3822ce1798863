#pragma once

#include <stdexcept>
#include <string>

class TreesumException : public std::runtime_error {
public:
    explicit TreesumException(const std::string& message)
        : std::runtime_error(message) {}
};

// The file could not be opened, or reading it failed part way through.
class FileAccessError : public TreesumException {
public:
    explicit FileAccessError(const std::string& message)
        : TreesumException(message) {}
};

// A caller handed the tree reducer something it cannot reduce (an empty level).
class InvalidInputError : public TreesumException {
public:
    explicit InvalidInputError(const std::string& message)
        : TreesumException(message) {}
};

class HashAlgorithmUnavailable : public TreesumException {
public:
    explicit HashAlgorithmUnavailable(const std::string& message)
        : TreesumException(message) {}
};
