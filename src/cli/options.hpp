#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

struct CliOptions {
    ConfigOverrides overrides;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> warnings;   // unsupported -o keys
};

// Parse `[options] [user@]host [command...]` (argv without the program
// name). Options end at the destination or at "--"; everything after the
// destination is joined with spaces into the command. user@host overrides -l.
Result<CliOptions> parse_options(const std::vector<std::string>& args);

// Apply one `-o Key=Value` (also `Key Value`). Returns false for keys
// sshc does not support.
Result<bool> apply_ssh_option(const std::string& option, ConfigOverrides& out);

std::string usage_text();
