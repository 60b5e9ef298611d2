#include "commands/CliArgs.hpp"

#include <algorithm>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::vector<std::string> positional(int argc, char** argv, const std::vector<std::string>& valued_flags) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (std::find(valued_flags.begin(), valued_flags.end(), a) != valued_flags.end()) {
            ++i;
            continue;
        }
        if (a.rfind("--", 0) == 0) continue;
        out.push_back(a);
    }
    return out;
}

} // namespace cli
