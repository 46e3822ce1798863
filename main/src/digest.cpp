#include "digest.hpp"

#include <iomanip>
#include <sstream>

std::string to_hex(const Digest& digest) {
    std::stringstream ss;
    for (std::uint8_t byte : digest) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}
