/**
 * @file chunk_inspector.cpp
 * @brief Inspect a file holding one serialized chunk
 *
 * Shows how to parse untrusted input with limits and a warning handler,
 * and how each error type can be told apart.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/codec_options.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    std::vector<std::byte> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file '" + path + "'");
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        std::transform(raw.begin(), raw.end(), data.begin(), [](char c) { return static_cast<std::byte>(c); });
        return data;
    }

    void print_flag(const char* name, bool value) {
        std::cout << "  " << std::left << std::setw(14) << name << (value ? "yes" : "no") << "\n";
    }

    void print_usage(const char* program) {
        std::cout << "Usage: " << program << " <file> [max payload bytes]\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    pngchunk::codec_options options;
    options.strict = true;
    options.max_chunk_length = (std::uint64_t(1) << 31) - 1;
    if (argc == 3) {
        char* end = nullptr;
        errno = 0;
        auto limit = std::strtoull(argv[2], &end, 10);
        if (end == argv[2] || *end != '\0' || argv[2][0] == '-' || errno == ERANGE) {
            std::cerr << "Invalid payload limit '" << argv[2] << "'\n";
            print_usage(argv[0]);
            return 1;
        }
        options.max_chunk_length = limit;
    }

    int warnings = 0;
    options.on_warning = [&warnings](std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings++;
        std::cout << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto data = read_file(argv[1]);
        auto c = pngchunk::chunk::parse(data, options);

        std::cout << c << "\n";
        const auto& type = c.type();
        print_flag("critical", type.is_critical());
        print_flag("public", type.is_public());
        print_flag("valid", type.is_valid());
        print_flag("safe to copy", type.is_safe_to_copy());

        try {
            std::cout << "Payload: " << c.payload_as_string() << "\n";
        } catch (const pngchunk::invalid_utf8_error& e) {
            std::cout << "Payload: " << c.length() << " bytes of binary data (" << e.what() << ")\n";
        }

        std::cout << warnings << " warning(s)\n";

    } catch (const pngchunk::empty_input_error&) {
        std::cerr << "Error: file is empty\n";
        return 2;
    } catch (const pngchunk::truncated_input_error& e) {
        std::cerr << "Error: truncated chunk, " << e.available() << " of " << e.needed() << " bytes present\n";
        return 2;
    } catch (const pngchunk::crc_mismatch_error& e) {
        std::cerr << "Error: corrupted chunk, CRC " << std::hex << std::setfill('0')
                  << std::setw(8) << e.found() << " should be " << std::setw(8) << e.expected() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
