/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic libpngchunk usage
 *
 * Builds a chunk carrying a text message, prints its wire bytes and
 * parses them back.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <iomanip>
#include <iostream>
#include <string_view>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cout << "Usage: " << argv[0] << " <chunk type> <message>\n";
        std::cout << "\n";
        std::cout << "Encodes <message> in a chunk of type <chunk type> (four letters, e.g. RuSt)\n";
        std::cout << "and decodes it again.\n";
        return 1;
    }

    try {
        auto type = pngchunk::chunk_type::from_text(argv[1]);
        pngchunk::chunk c(type, std::string_view(argv[2]));

        std::cout << c << "\n";
        std::cout << "  critical: " << std::boolalpha << type.is_critical()
                  << ", public: " << type.is_public()
                  << ", valid: " << type.is_valid()
                  << ", safe to copy: " << type.is_safe_to_copy() << "\n\n";

        auto wire = c.serialize();
        std::cout << "Wire bytes (" << wire.size() << "):\n";
        for (std::size_t i = 0; i < wire.size(); i++) {
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << std::to_integer<unsigned>(wire[i]) << ((i % 16 == 15) ? "\n" : " ");
        }
        std::cout << std::dec << "\n\n";

        auto decoded = pngchunk::chunk::parse(wire);
        std::cout << "Decoded message: " << decoded.payload_as_string() << "\n";

    } catch (const pngchunk::chunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
