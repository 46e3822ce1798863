#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Every supported algorithm yields a 32-byte digest.
inline constexpr std::size_t DIGEST_SIZE = 32;

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// One stage of the reduction; the first stage is the leaf sequence.
using TreeLevel = std::vector<Digest>;
using LeafSequence = TreeLevel;

// Lowercase hexadecimal rendering, 64 characters.
std::string to_hex(const Digest& digest);
