/**
 * @file png_chunks.cpp
 * @brief List the chunks of a PNG file
 *
 * Minimal example of walking a file with chunk_iterator. Damaged
 * chunks are reported as warnings instead of stopping the walk.
 */

#include <pngme/chunk_iterator.hh>
#include <pngme/png.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>
#include <algorithm>
#include <cstdint>
#include <string_view>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Lists every chunk of a PNG file with its properties.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }
    std::vector<char> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    const auto& sig = pngme::png::standard_header;
    if (data.size() < sig.size() ||
        !std::equal(sig.begin(), sig.end(), reinterpret_cast<const std::byte*>(data.data()))) {
        std::cerr << "Error: '" << argv[1] << "' is not a PNG file\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    pngme::parse_options options;
    options.strict = false;
    options.max_chunk_size = pngme::png::MAX_CHUNK_LENGTH;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        pngme::chunk_iterator it(data.data(), data.size(), options, sig.size());
        while (it.has_next()) {
            const auto& info = it.current();
            std::cout << "Chunk: " << info.header.type.to_string()
                      << " (" << info.header.length << " bytes) at offset "
                      << info.header.file_offset << "\n";
            std::cout << "  " << info.header.type.describe() << "\n";
            it.next();
        }

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
