/**
 * @file cmd_nonce.cpp
 * @brief nonce subcommand: print a fresh nonce or salt as hex
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/atomcrypte.h"
#include "cli_utils.h"

#include <iostream>
#include <string>

using namespace atomcrypte;

namespace {

void print_nonce_help() {
    std::cout << "\nUsage: atomcrypte nonce [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -type <kind>      random | hashed | tagged | machine | salt (default: random)\n";
    std::cout << "  -tag <string>     Tag for -type tagged\n";
    std::cout << "  -len <n>          Length in bytes, 8..64 (default: 32)\n";
    std::cout << "  --help            Show this help message\n\n";
}

} // anonymous namespace

int cmd_nonce(int argc, char* argv[]) {
    try {
        std::string type = "random";
        std::string tag;
        size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE;

        for (int i = 1; i < argc; ++i) {
            const std::string arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                print_nonce_help();
                return 0;
            } else if (arg == "-type") {
                type = cli::require_value(argc, argv, i);
            } else if (arg == "-tag") {
                tag = cli::require_value(argc, argv, i);
            } else if (arg == "-len") {
                len = cli::parse_u32(cli::require_value(argc, argv, i), arg);
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }

        ByteVec value;
        if (type == "random") {
            value = nonce::random(len);
        } else if (type == "hashed") {
            value = nonce::hashed(len);
        } else if (type == "tagged") {
            if (tag.empty()) {
                throw std::invalid_argument("-type tagged requires -tag");
            }
            value = nonce::tagged(tag, len);
        } else if (type == "machine") {
            value = nonce::machine(len);
        } else if (type == "salt") {
            value = nonce::salt(len);
        } else {
            throw std::invalid_argument("Unknown nonce type: " + type);
        }

        std::cout << encoding::hex_encode(value) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: nonce failed: " << e.what() << "\n";
        return 1;
    }
}
