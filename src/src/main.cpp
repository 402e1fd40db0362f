// pjson - parse a JSON document and print its value tree

#include <pj/cli_args.h>
#include <pj/json.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

const char* kUsage = "usage: pjson [--strict] [--verbose] <file>\n";

void showHelp() {
    std::cout << "pjson - Parse a JSON document and print its value tree\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  pjson [options] <file>\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --strict        Fail when anything but whitespace follows the value\n";
    std::cout << "  --verbose, -v   Report what was read and what was left unparsed\n";
    std::cout << "  --help, -h      Show this help\n";
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    // an empty file sets failbit on the copy, a read error sets badbit
    if (file.peek() != std::ifstream::traits_type::eof()) {
        buffer << file.rdbuf();
        if (!buffer || file.bad()) return false;
    } else if (file.bad()) {
        return false;
    }
    content = buffer.str();
    return true;
}

}  // namespace

int main(int argc, const char* argv[]) {
    pj::CliArgs::Action action = pj::CliArgs::Action::USAGE;
    std::string path;
    bool strict = false;
    bool verbose = false;
    try {
        pj::CliArgs args(argc, argv);
        action = args.getAction();
        path = args.getFilePath();
        strict = args.strict();
        verbose = args.verbose();
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n" << kUsage;
        return 2;
    }

    if (action == pj::CliArgs::Action::HELP) {
        showHelp();
        return 0;
    }

    std::error_code ec;
    std::string content;
    if (action == pj::CliArgs::Action::USAGE || !std::filesystem::is_regular_file(path, ec) ||
        !readFile(path, content)) {
        std::cerr << kUsage;
        return 2;
    }
    if (verbose) std::cerr << "read " << content.size() << " bytes from " << path << "\n";

    auto result = strict ? pj::parse_document(content) : pj::parse(content);
    if (!result) {
        std::cerr << "error: " << pj::format_error(content, result.error()) << "\n";
        return 1;
    }
    if (verbose) std::cerr << result.rest().size() << " bytes left unparsed\n";

    std::cout << result.value().dump(2) << "\n";
    return 0;
}
