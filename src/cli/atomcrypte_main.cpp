/**
 * @file atomcrypte_main.cpp
 * @brief atomcrypte Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   atomcrypte <command> [options]
 *
 * Commands:
 *   encrypt      Encrypt a file with a password
 *   decrypt      Decrypt and authenticate a file
 *   nonce        Generate a nonce or salt
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "atomcrypte/atomcrypte.h"
#include "atomcrypte/crypto/pipeline.h"

#include <openssl/opensslv.h>

// Subcommand handlers
int cmd_encrypt(int argc, char* argv[]);
int cmd_decrypt(int argc, char* argv[]);
int cmd_nonce(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: atomcrypte <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  encrypt      Encrypt a file with a password\n";
    std::cout << "  decrypt      Decrypt and authenticate a file\n";
    std::cout << "  nonce        Generate a nonce or salt (hex)\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  atomcrypte encrypt -in file.txt -out file.enc -password pw -wrap\n";
    std::cout << "  atomcrypte decrypt -in file.enc -out file.txt -password pw -wrap\n";
    std::cout << "  atomcrypte encrypt -in f -out f.enc -password pw -profile max -threads full\n";
    std::cout << "  atomcrypte nonce -type machine -len 32\n\n";
    std::cout << "For command-specific help, use: atomcrypte <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    const atomcrypte::cpu::CPUFeatures& cpu = atomcrypte::cpu::CPUFeatures::current();
    std::cout << "\n";
    std::cout << ATOMCRYPTE_LIBRARY_NAME << " - " << ATOMCRYPTE_DESCRIPTION << "\n\n";
    std::cout << "Version:      " << atomcrypte_version() << " (" << ATOMCRYPTE_BUILD_TYPE << ")\n";
    std::cout << "Format:       0x" << std::hex << ATOMCRYPTE_FORMAT_VERSION << std::dec << "\n";
    std::cout << "Platform:     " << atomcrypte_platform() << "\n";
    std::cout << "CPU:          " << cpu.to_string() << "\n";
    std::cout << "AVX2 kernel:  "
              << (atomcrypte::ChunkRoundPipeline::vector_backend_available() ? "available" : "unavailable")
              << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Primitives (OpenSSL " << OPENSSL_VERSION_STR << "):\n";
    std::cout << "  - scrypt key derivation, BLAKE2b / BLAKE2b-MAC extract\n";
    std::cout << "  - ChaCha20 round keystreams\n";
    std::cout << "  - HMAC-SHA3-512 authentication\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    if (atomcrypte_init() != ATOMCRYPTE_SUCCESS) {
        std::cerr << "\nError: library initialization failed\n";
        return 1;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    int rc = 0;
    if (command == "encrypt" || command == "enc") {
        rc = cmd_encrypt(argc - 1, argv + 1);
    }
    else if (command == "decrypt" || command == "dec") {
        rc = cmd_decrypt(argc - 1, argv + 1);
    }
    else if (command == "nonce") {
        rc = cmd_nonce(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        rc = 1;
    }

    atomcrypte_cleanup();
    return rc;
}
