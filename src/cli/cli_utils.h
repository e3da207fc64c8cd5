/**
 * @file cli_utils.h
 * @brief Common utility functions for atomcrypte CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CLI_UTILS_H
#define ATOMCRYPTE_CLI_UTILS_H

#include "atomcrypte/core/types.h"
#include "atomcrypte/utils/encoding.h"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace atomcrypte {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline ByteVec read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return ByteVec(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/**
 * @brief Write byte vector to file
 */
inline void write_file(const std::string& filename, const ByteVec& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

/**
 * @brief Base64 text file contents, surrounding whitespace ignored
 */
inline ByteVec read_base64_file(const std::string& filename) {
    const ByteVec raw = read_file(filename);
    std::string text(raw.begin(), raw.end());
    const size_t first = text.find_first_not_of(" \t\r\n");
    const size_t last = text.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return ByteVec();
    }
    return encoding::base64_decode(text.substr(first, last - first + 1));
}

inline void write_base64_file(const std::string& filename, const ByteVec& data) {
    const std::string text = encoding::base64_encode(data) + "\n";
    write_file(filename, ByteVec(text.begin(), text.end()));
}

/**
 * @brief Value following option argv[i]; advances i
 */
inline std::string require_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

inline uint32_t parse_u32(const std::string& text, const std::string& option) {
    size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + text);
    }
    if (used != text.size() || value > UINT32_MAX) {
        throw std::invalid_argument("Invalid number for " + option + ": " + text);
    }
    return static_cast<uint32_t>(value);
}

} // namespace cli
} // namespace atomcrypte

#endif // ATOMCRYPTE_CLI_UTILS_H
