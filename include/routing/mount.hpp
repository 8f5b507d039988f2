#pragma once

#include "routing/rule_registry.hpp"

#include <memory>
#include <string>

namespace rulegate {

class RequestForwarder;
class StreamingRelay;
class CredentialManager;

/**
 * @brief A mount prefix bound to one upstream and its ordered rule table
 */
struct Mount {
    std::string name;
    std::string prefix;                     // e.g. "/ragflow", no trailing slash
    std::string base_path;                  // Prepended to every upstream path
    RuleRegistry rules;

    std::shared_ptr<RequestForwarder> forwarder;
    std::shared_ptr<StreamingRelay> relay;              // nullptr without streaming rules
    std::shared_ptr<CredentialManager> credentials;     // nullptr when the upstream is open

    // Column the caller's scope ids restrict (DataScopePredicate)
    std::string scope_entity;
    std::string scope_column;
};

} // namespace rulegate
