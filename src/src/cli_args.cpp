#include <vcsv/cli_args.h>
#include <vcsv/cli_utils.h>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace vcsv {

namespace {
    std::uint64_t parse_count(const std::string& flag, const std::string& text) {
        if (text.empty()) throw std::invalid_argument(flag + " requires a non-negative integer");
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument(flag + " requires a non-negative integer, got '" + text + "'");
            }
        }
        try {
            return std::stoull(text);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument(flag + " value out of range: " + text);
        }
    }
}  // anonymous namespace

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        action_ = Action::HELP;
        return;
    }

    // First argument is the file path
    filePath_ = first;
    action_ = Action::PRINT;

    static const std::vector<std::string> valid_options = {
        "--horizontal", "--vertical", "--auto",
        "--schema", "-s",
        "--mmap-threshold",
        "--count", "--fields", "--undeclared",
        "--as-json", "--verbose", "-v"
    };

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--horizontal") {
            layout_ = Layout::Horizontal;
        }
        else if (arg == "--vertical") {
            layout_ = Layout::Vertical;
        }
        else if (arg == "--auto") {
            layout_.reset();
        }
        else if (arg == "--schema" || arg == "-s") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--schema requires a version argument");
            }
            std::uint64_t v = parse_count("--schema", argv[++i]);
            if (v < 1 || v > 4) {
                throw std::invalid_argument("--schema must be between 1 and 4");
            }
            schemaVersion_ = static_cast<int>(v);
        }
        else if (arg == "--mmap-threshold") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--mmap-threshold requires a byte count");
            }
            mmapThreshold_ = parse_count("--mmap-threshold", argv[++i]);
        }
        else if (arg == "--count") {
            action_ = Action::COUNT;
        }
        else if (arg == "--fields") {
            action_ = Action::FIELDS;
        }
        else if (arg == "--undeclared") {
            action_ = Action::UNDECLARED;
        }
        else if (arg == "--as-json") {
            asJson_ = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, valid_options));
        }
    }
}

}  // namespace vcsv
