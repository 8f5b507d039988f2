#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rulegate {

/**
 * @brief One forwarding rule of a mount
 *
 * path_pattern is an ECMAScript regular expression evaluated against the
 * start of the sub-path (the part after the mount prefix).
 */
struct Rule {
    std::string name;
    std::string path_pattern;
    std::string method = kMethodWildcard;   // Exact verb or "*"
    Requirement permission;
    Requirement role;
    bool straightforward = false;           // Byte-exact passthrough
    bool streaming = false;                 // Relay as text/event-stream
    std::optional<std::string> upstream_path;
    std::vector<std::string> pre_processors;
    std::vector<std::string> post_processors;
    std::string description;
};

} // namespace rulegate
