/**
 * @file cli.cpp
 * @brief dec128 command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Decodes decimal128 records given as hex on the command line or as a
 * binary file and prints their canonical strings.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008
 */

#include <dec128/dec128.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace dec128;

static void print_version() {
    std::printf("dec128 %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nIEEE 754-2008 decimal128 decoder (v%s C++)\n", version());
    std::printf("==========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [-s] [-x] <hex>...\n", prog_name);
    std::printf("  %s [-s] [-x] -f <file>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -f <file>      Read binary file of 16-byte records\n");
    std::printf("  -s             Sort records (NaN < -Infinity < ... < Infinity < NaN)\n");
    std::printf("  -x             Also print raw bytes, least significant first\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  hex            32 hex digits, big-endian, optional 0x prefix\n\n");
    std::printf("Examples:\n");
    std::printf("  %s 303400000000000000000000000004d2     # 0.001234\n", prog_name);
    std::printf("  %s -s -f values.bin                      # sorted file\n\n", prog_name);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static bool parse_hex(const char* text, Decimal128::Bytes& bytes) {
    if (text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text += 2;
    }
    if (std::strlen(text) != HEX_STRING_LENGTH) {
        return false;
    }

    for (std::size_t i = 0; i < NUM_BYTES; ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

static std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }

    return buffer;
}

static bool load_records(const char* input_path, std::vector<Decimal128>& values) {
    auto input_data = read_file(input_path);
    if (input_data.empty()) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return false;
    }

    std::size_t input_size = input_data.size();
    if ((input_size % NUM_BYTES) != 0) {
        std::fprintf(stderr, "Error: Input size (%zu) not divisible by record size (%zu)\n",
                     input_size, NUM_BYTES);
        return false;
    }

    values.resize(input_size / NUM_BYTES);
    std::size_t count = 0;
    Error result = decode_records(input_data.data(), input_size, values.data(), values.size(),
                                  count);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Decoding failed: %s\n", error_string(result));
        return false;
    }

    values.resize(count);
    return true;
}

static void print_records(const std::vector<Decimal128>& values, bool show_hex) {
    for (const auto& value : values) {
        if (show_hex) {
            std::printf("%-44s %s\n", value.to_string().c_str(), value.to_hex().c_str());
        } else {
            std::printf("%s\n", value.to_string().c_str());
        }
    }
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    bool sort_mode = false;
    bool show_hex = false;
    const char* input_path = nullptr;
    std::vector<const char*> hex_args;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            sort_mode = true;
        } else if (std::strcmp(argv[i], "-x") == 0) {
            show_hex = true;
        } else if (std::strcmp(argv[i], "-f") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: -f requires a file argument\n");
                return 1;
            }
            input_path = argv[++i];
        } else if (argv[i][0] == '-') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", argv[i]);
            return 1;
        } else {
            hex_args.push_back(argv[i]);
        }
    }

    if (input_path != nullptr && !hex_args.empty()) {
        std::fprintf(stderr, "Error: Give either -f <file> or hex records, not both\n");
        return 1;
    }
    if (input_path == nullptr && hex_args.empty()) {
        std::fprintf(stderr, "Error: No records given\n");
        std::fprintf(stderr, "Usage: %s [-s] [-x] <hex>... | -f <file>\n", argv[0]);
        return 1;
    }

    std::vector<Decimal128> values;
    if (input_path != nullptr) {
        if (!load_records(input_path, values)) {
            return 1;
        }
    } else {
        for (const char* arg : hex_args) {
            Decimal128::Bytes bytes;
            if (!parse_hex(arg, bytes)) {
                std::fprintf(stderr, "Error: Expected %zu hex digits: %s\n", HEX_STRING_LENGTH,
                             arg);
                return 1;
            }
            values.push_back(decode(bytes));
        }
    }

    if (sort_mode) {
        std::stable_sort(values.begin(), values.end());
    }

    print_records(values, show_hex);
    return 0;
}
