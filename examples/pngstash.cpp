#include <pngstash/pngstash.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <command> [args]\n";
    std::cerr << "Hides text messages in PNG files as extra chunks.\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  encode <file> <chunk_type> <message> [output_file]\n";
    std::cerr << "  decode <file> <chunk_type>\n";
    std::cerr << "  remove <file> <chunk_type> [output_file]\n";
    std::cerr << "  print <file>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --strict       Reject chunk types that are not four letters\n";
    std::cerr << "  --before-iend  Insert encoded chunks before IEND\n";
    std::cerr << "  -h, --help     Show this help\n";
}

int report(const pngstash::stash_result& result) {
    std::cerr << "Error: " << result.message << "\n";
    return 1;
}

// Options are only accepted before the command
bool looks_like_option(std::string_view arg) {
    return arg.size() > 1 && arg[0] == '-';
}

int run_encode(const std::vector<std::string_view>& args, const pngstash::stash_options& options) {
    const std::filesystem::path input(args[1]);
    const std::filesystem::path output = args.size() > 4 ? std::filesystem::path(args[4])
                                                         : std::filesystem::path();

    auto result = pngstash::encode_file(input, args[2], args[3], output, options);
    if (!result) return report(result);

    std::cout << args[3] << "\n";
    return 0;
}

int run_decode(const std::vector<std::string_view>& args, const pngstash::stash_options& options) {
    std::string message;
    auto result = pngstash::decode_file(std::filesystem::path(args[1]), args[2], message, options);
    if (!result) return report(result);

    std::cout << message << "\n";
    return 0;
}

int run_remove(const std::vector<std::string_view>& args, const pngstash::stash_options& options) {
    const std::filesystem::path input(args[1]);
    const std::filesystem::path output = args.size() > 3 ? std::filesystem::path(args[3])
                                                         : std::filesystem::path();

    auto result = pngstash::remove_file(input, args[2], output, options);
    if (!result) return report(result);

    std::cout << "Removed chunk '" << args[2] << "' from " << input.string() << "\n";
    return 0;
}

int run_print(const std::vector<std::string_view>& args, const pngstash::stash_options& options) {
    std::string listing;
    auto result = pngstash::print_file(std::filesystem::path(args[1]), listing, options);
    if (!result) return report(result);

    std::cout << listing;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    pngstash::stash_options options;

    // Options come before the command so messages may start with a dash
    int first = 1;
    for (; first < argc; ++first) {
        if (std::strcmp(argv[first], "-h") == 0 || std::strcmp(argv[first], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[first], "--strict") == 0) {
            options.strict_chunk_types = true;
        } else if (std::strcmp(argv[first], "--before-iend") == 0) {
            options.insert_before_iend = true;
        } else {
            break;
        }
    }

    std::vector<std::string_view> args(argv + first, argv + argc);
    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string_view command = args[0];

    // A trailing option would otherwise be taken as the output file name
    if ((command == "encode" && args.size() == 5 && looks_like_option(args[4])) ||
        (command == "remove" && args.size() == 4 && looks_like_option(args[3]))) {
        std::cerr << "Error: unexpected option '" << args.back()
                  << "' after the command; options go before the command\n";
        print_usage(argv[0]);
        return 1;
    }

    if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
        return run_encode(args, options);
    }
    if (command == "decode" && args.size() == 3) {
        return run_decode(args, options);
    }
    if (command == "remove" && (args.size() == 3 || args.size() == 4)) {
        return run_remove(args, options);
    }
    if (command == "print" && args.size() == 2) {
        return run_print(args, options);
    }

    print_usage(argv[0]);
    return 1;
}
