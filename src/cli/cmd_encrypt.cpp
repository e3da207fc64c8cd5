/**
 * @file cmd_encrypt.cpp
 * @brief encrypt / decrypt subcommands for the atomcrypte CLI
 *
 * Detached output (default) writes [ciphertext][tag] and prints the nonce
 * and salt, which the caller must keep. -wrap writes a self-describing blob
 * that carries them.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/atomcrypte.h"
#include "cli_utils.h"

#include <iostream>
#include <optional>
#include <string>

using namespace atomcrypte;

namespace {

struct CryptOptions {
    std::string in_file;
    std::string out_file;
    std::string password;
    bool machine_bind = false;
    std::optional<ByteVec> nonce_value;
    std::optional<ByteVec> salt_value;
    Config config = Config::from_profile(Profile::Standard);
    bool base64 = false;
    bool recovery = false;
    std::string recovery_key_hex;
    std::string recovery_block_file;
    std::string log_level;
};

void print_crypt_help(const char* command) {
    std::cout << "\nUsage: atomcrypte " << command << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>            Input file\n";
    std::cout << "  -out <file>           Output file\n";
    std::cout << "  -password <string>    Password\n";
    std::cout << "  -machine-bind         Bind the password to this user and host\n";
    std::cout << "  -nonce <hex>          Nonce, 8..64 bytes (encrypt: random if omitted)\n";
    std::cout << "  -salt <hex>           Salt, 8..64 bytes (default: nonce)\n";
    std::cout << "  -profile <name>       standard | secure | max (default: standard)\n";
    std::cout << "  -key-bits <256|512>   Key length (switches to a custom profile)\n";
    std::cout << "  -rounds <n>           Round count (switches to a custom profile)\n";
    std::cout << "  -threads <mode>       auto | full | low | <count>\n";
    std::cout << "  -sbox <source>        password | nonce | combined (default: combined)\n";
    std::cout << "  -kdf-cost <n>         log2 scrypt work factor, 4..20 (default: 15)\n";
    std::cout << "  -wrap                 Self-describing output (salt, nonce, params)\n";
    std::cout << "  -dummy                Random padding outside the MAC\n";
    std::cout << "  -recovery             encrypt: emit a recovery key\n";
    std::cout << "                        decrypt: fall back to the recovery block\n";
    std::cout << "  -recovery-key <hex>   decrypt: recovery key to use\n";
    std::cout << "  -recovery-block <f>   Detached recovery block file (written on encrypt)\n";
    std::cout << "  -base64               Base64 ciphertext I/O\n";
    std::cout << "  -benchmark            Print per-phase timings\n";
    std::cout << "  -log <level>          debug | info | warn | error | off\n";
    std::cout << "  --help                Show this help message\n\n";
}

/**
 * @return false if help was requested
 */
bool parse_crypt_options(int argc, char* argv[], CryptOptions& opts, const char* command) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_crypt_help(command);
            return false;
        } else if (arg == "-in") {
            opts.in_file = cli::require_value(argc, argv, i);
        } else if (arg == "-out") {
            opts.out_file = cli::require_value(argc, argv, i);
        } else if (arg == "-password") {
            opts.password = cli::require_value(argc, argv, i);
        } else if (arg == "-machine-bind") {
            opts.machine_bind = true;
        } else if (arg == "-nonce") {
            opts.nonce_value = encoding::hex_decode(cli::require_value(argc, argv, i));
        } else if (arg == "-salt") {
            opts.salt_value = encoding::hex_decode(cli::require_value(argc, argv, i));
        } else if (arg == "-profile") {
            const Config base = Config::from_profile(
                Config::parse_profile(cli::require_value(argc, argv, i)));
            // Keep the flags already given
            Config merged = base;
            merged.thread_strategy = opts.config.thread_strategy;
            merged.sbox_source = opts.config.sbox_source;
            merged.output_shape = opts.config.output_shape;
            merged.recovery_key = opts.config.recovery_key;
            merged.dummy_data = opts.config.dummy_data;
            merged.benchmark = opts.config.benchmark;
            merged.kdf_cost = opts.config.kdf_cost;
            opts.config = merged;
        } else if (arg == "-key-bits") {
            const uint32_t bits = cli::parse_u32(cli::require_value(argc, argv, i), arg);
            if (bits != 256 && bits != 512) {
                throw std::invalid_argument("Key length must be 256 or 512");
            }
            opts.config = opts.config.with_key_length(bits == 256 ? KeyLength::Bits256
                                                                  : KeyLength::Bits512);
        } else if (arg == "-rounds") {
            opts.config = opts.config.with_rounds(
                cli::parse_u32(cli::require_value(argc, argv, i), arg));
        } else if (arg == "-threads") {
            opts.config = opts.config.with_threads(
                ThreadStrategy::parse(cli::require_value(argc, argv, i)));
        } else if (arg == "-sbox") {
            opts.config = opts.config.with_sbox(
                Config::parse_sbox(cli::require_value(argc, argv, i)));
        } else if (arg == "-kdf-cost") {
            opts.config = opts.config.with_kdf_cost(
                cli::parse_u32(cli::require_value(argc, argv, i), arg));
        } else if (arg == "-wrap") {
            opts.config = opts.config.with_output_shape(OutputShape::Wrapped);
        } else if (arg == "-dummy") {
            opts.config = opts.config.with_dummy_data(true);
        } else if (arg == "-recovery") {
            opts.recovery = true;
        } else if (arg == "-recovery-key") {
            opts.recovery_key_hex = cli::require_value(argc, argv, i);
            opts.recovery = true;
        } else if (arg == "-recovery-block") {
            opts.recovery_block_file = cli::require_value(argc, argv, i);
        } else if (arg == "-base64") {
            opts.base64 = true;
        } else if (arg == "-benchmark") {
            opts.config = opts.config.with_benchmark(true);
        } else if (arg == "-log") {
            opts.log_level = cli::require_value(argc, argv, i);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (opts.in_file.empty() || opts.out_file.empty()) {
        throw std::invalid_argument("-in and -out are required");
    }
    if (opts.password.empty() && opts.recovery_key_hex.empty()) {
        throw std::invalid_argument("-password or -recovery-key is required");
    }
    if (!opts.log_level.empty()) {
        log::Level level = log::Level::Warn;
        if (!log::parse_level(opts.log_level, level)) {
            throw std::invalid_argument("Unknown log level: " + opts.log_level);
        }
        log::set_level(level);
    }
    return true;
}

SecureBytes effective_password(const CryptOptions& opts) {
    SecureBytes password(opts.password);
    if (opts.machine_bind) {
        return nonce::machine_bound_password(password);
    }
    return password;
}

int report_failure(const char* command, const std::exception& e) {
    std::cerr << "\nError: " << command << " failed: " << e.what() << "\n";
    return 1;
}

} // anonymous namespace

int cmd_encrypt(int argc, char* argv[]) {
    try {
        CryptOptions opts;
        if (!parse_crypt_options(argc, argv, opts, "encrypt")) {
            return 0;
        }
        opts.config.recovery_key = opts.recovery;
        opts.config.validate();

        const ByteVec plaintext = cli::read_file(opts.in_file);
        const ByteVec nonce_bytes = opts.nonce_value ? *opts.nonce_value : nonce::random();
        const KeyMaterial material(effective_password(opts), nonce_bytes, opts.salt_value);

        EncryptedOutput output = Engine().encrypt(opts.config, material, plaintext);
        const ByteVec blob = output.serialize();
        if (opts.base64) {
            cli::write_base64_file(opts.out_file, blob);
        } else {
            cli::write_file(opts.out_file, blob);
        }

        std::cout << "Encrypted " << plaintext.size() << " bytes -> " << blob.size()
                  << " bytes (" << to_string(opts.config.profile) << ", "
                  << opts.config.rounds << " rounds)\n";
        if (opts.config.output_shape == OutputShape::Detached) {
            std::cout << "nonce: " << encoding::hex_encode(nonce_bytes) << "\n";
            if (opts.salt_value) {
                std::cout << "salt:  " << encoding::hex_encode(*opts.salt_value) << "\n";
            }
        }
        if (opts.recovery) {
            const SecureBytes recovery_key = output.take_recovery_key();
            std::cout << "recovery key: "
                      << encoding::hex_encode(recovery_key.data(), recovery_key.size()) << "\n";
            if (opts.config.output_shape == OutputShape::Detached) {
                if (opts.recovery_block_file.empty()) {
                    std::cerr << "Warning: detached output without -recovery-block; "
                                 "the recovery block is discarded\n";
                } else {
                    cli::write_file(opts.recovery_block_file, output.recovery_block);
                }
            }
        }
        return 0;
    } catch (const std::exception& e) {
        return report_failure("encrypt", e);
    }
}

int cmd_decrypt(int argc, char* argv[]) {
    try {
        CryptOptions opts;
        if (!parse_crypt_options(argc, argv, opts, "decrypt")) {
            return 0;
        }
        opts.config.validate();
        if (opts.config.output_shape == OutputShape::Detached && !opts.nonce_value) {
            throw std::invalid_argument("-nonce is required for detached input");
        }

        const ByteVec blob = opts.base64 ? cli::read_base64_file(opts.in_file)
                                         : cli::read_file(opts.in_file);
        const KeyMaterial material(effective_password(opts),
                                   opts.nonce_value ? *opts.nonce_value : ByteVec(),
                                   opts.salt_value);

        DecryptOptions decrypt_opts;
        if (opts.recovery) {
            decrypt_opts.key_path = KeyPath::Recovery;
            if (!opts.recovery_key_hex.empty()) {
                const ByteVec key = encoding::hex_decode(opts.recovery_key_hex);
                decrypt_opts.recovery_key = SecureBytes(key);
            }
            if (!opts.recovery_block_file.empty()) {
                decrypt_opts.recovery_block = cli::read_file(opts.recovery_block_file);
            }
        }

        ByteVec plaintext = Engine().decrypt(opts.config, material, blob, decrypt_opts);
        WipeGuard guard(plaintext);
        cli::write_file(opts.out_file, plaintext);
        std::cout << "Decrypted " << blob.size() << " bytes -> " << plaintext.size()
                  << " bytes\n";
        return 0;
    } catch (const std::exception& e) {
        return report_failure("decrypt", e);
    }
}
