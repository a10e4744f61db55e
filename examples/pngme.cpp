/**
 * @file pngme.cpp
 * @brief Hide text messages in PNG files
 *
 * Stores a message in a chunk of the user's choosing (typically an
 * ancillary, private, safe-to-copy type such as "ruSt" that image
 * viewers ignore), and reads it back or removes it later.
 *
 * Usage:
 *   pngme encode <file> <chunk_type> <message> [output]
 *   pngme decode <file> <chunk_type>
 *   pngme remove <file> <chunk_type>
 *   pngme print  <file>
 */

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

    enum class action {
        encode,
        decode,
        remove,
        print
    };

    struct arguments {
        action what;
        std::string file_path;
        std::optional<std::string> chunk_type;
        std::optional<std::string> message;
        std::optional<std::string> output_path;
    };

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <action> <file> [chunk_type] [message] [output]\n";
        std::cout << "\n";
        std::cout << "Actions:\n";
        std::cout << "  encode  embed <message> in a new <chunk_type> chunk\n";
        std::cout << "  decode  print the message stored in the first <chunk_type> chunk\n";
        std::cout << "  remove  delete the first <chunk_type> chunk\n";
        std::cout << "  print   list every chunk of the file\n";
        std::cout << "\n";
        std::cout << "Example:\n";
        std::cout << "  " << prog << " encode ./dice.png ruSt \"This is a secret message!\"\n";
    }

    std::optional<action> parse_action(const std::string& s) {
        if (s == "encode") return action::encode;
        if (s == "decode") return action::decode;
        if (s == "remove") return action::remove;
        if (s == "print") return action::print;
        return std::nullopt;
    }

    // Returns an error message when the action lacks the arguments it needs
    std::optional<std::string> check_arguments(const arguments& args) {
        if (args.what == action::encode && (!args.chunk_type || !args.message)) {
            return std::string("Missing chunk type and message from your argument list, use -h to learn how to use");
        }
        if ((args.what == action::decode || args.what == action::remove) && !args.chunk_type) {
            return std::string("Missing chunk type from your argument list, use -h to learn how to use");
        }
        return std::nullopt;
    }

    pngme::png load(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            THROW_IO("Cannot open file '", path, "'");
        }
        return pngme::png::from_stream(file);
    }

    void save(const pngme::png& image, const std::string& path) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            THROW_IO("Cannot create file '", path, "'");
        }
        image.write_to(file);
    }

    int run(const arguments& args) {
        auto image = load(args.file_path);

        switch (args.what) {
            case action::encode: {
                image.append_chunk(pngme::chunk(pngme::chunk_type(*args.chunk_type), *args.message));
                const auto& out = args.output_path ? *args.output_path : args.file_path;
                save(image, out);
                std::cout << "Message stored in chunk '" << *args.chunk_type << "' of " << out << "\n";
                break;
            }
            case action::decode: {
                const auto* c = image.chunk_by_type(*args.chunk_type);
                if (!c) {
                    std::cerr << "No chunk of type '" << *args.chunk_type << "' in " << args.file_path << "\n";
                    return 1;
                }
                std::cout << c->data_as_string() << "\n";
                break;
            }
            case action::remove: {
                auto removed = image.remove_first_chunk(*args.chunk_type);
                save(image, args.file_path);
                std::cout << "Removed " << removed << "\n";
                break;
            }
            case action::print: {
                std::cout << image;
                break;
            }
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (argc < 3 || argc > 6) {
        print_usage(argv[0]);
        return 1;
    }

    auto what = parse_action(argv[1]);
    if (!what) {
        std::cerr << "Error: Invalid action '" << argv[1] << "'\n";
        return 1;
    }

    arguments args{*what, argv[2], std::nullopt, std::nullopt, std::nullopt};
    if (argc > 3) args.chunk_type = argv[3];
    if (argc > 4) args.message = argv[4];
    if (argc > 5) args.output_path = argv[5];

    if (auto err = check_arguments(args)) {
        std::cerr << "Error: " << *err << "\n";
        return 1;
    }

    try {
        return run(args);
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << " [" << pngme::to_string(e.code()) << "]\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
