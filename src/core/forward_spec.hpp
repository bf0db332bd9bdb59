#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Parse "local_port:remote_host:remote_port" (as given to -L).
// Both ports must be integers in 1..65535 and the host non-empty.
Result<ForwardSpec> parse_forward_spec(const std::string& spec);

// Parse every spec; the first malformed one fails the whole list.
Result<std::vector<ForwardSpec>> parse_forward_specs(const std::vector<std::string>& specs);

std::string format_forward_spec(const ForwardSpec& fwd);
