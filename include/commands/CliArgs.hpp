#pragma once
#include <string>
#include <vector>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Arguments that are neither flags nor flag values, after argv[0].
std::vector<std::string> positional(int argc, char** argv, const std::vector<std::string>& valued_flags);

} // namespace cli
