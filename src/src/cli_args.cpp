#include <pj/cli_args.h>
#include <pj/cli_utils.h>

#include <stdexcept>

namespace pj {

const std::vector<std::string>& CliArgs::options() {
    static const std::vector<std::string> known = {
        "--help", "-h",
        "--verbose", "-v",
        "--strict"
    };
    return known;
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    bool help = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg == "--strict") {
            strict_ = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, options()));
        }
        else if (!filePath_.empty()) {
            throw std::invalid_argument("unexpected extra argument: " + arg);
        }
        else {
            filePath_ = arg;
        }
    }

    if (help) action_ = Action::HELP;
    else if (filePath_.empty()) action_ = Action::USAGE;
    else action_ = Action::PRINT;
}

}  // namespace pj
