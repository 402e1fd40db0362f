#pragma once

#include <string>
#include <vector>

namespace pj {

// Command-line arguments of the pjson tool. Throws std::invalid_argument on
// an unknown option or a second file argument.
class CliArgs {
public:
    enum class Action {
        HELP,   // --help was given
        USAGE,  // no file argument
        PRINT   // parse the file and print its value tree
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    bool strict() const { return strict_; }
    bool verbose() const { return verbose_; }

    static const std::vector<std::string>& options();

private:
    Action action_ = Action::USAGE;
    std::string filePath_;
    bool strict_ = false;
    bool verbose_ = false;
};

}  // namespace pj
