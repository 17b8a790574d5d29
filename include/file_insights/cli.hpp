#pragma once
#include <string>
#include "file_insights/types.hpp"

namespace file_insights {
    void print_help(const std::string& program_name);
    CliParseResult parse_cli(int argc, char* argv[]);
}
