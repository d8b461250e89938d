#pragma once

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "configuration.hpp"
#include "errors.hpp"

namespace xpipe {

// Find the connection a short name refers to.
// The empty name is the default (local) connection.
// Otherwise the last name segment must match exactly, and among several
// matches the one with the fewest segments wins, query order breaking ties.
// Duplicates are not rejected yet, only reported in the log.
// Each call queries the whole connection list.
inline std::optional<std::string> resolve_connection_name(ApiClient& client, const std::string& name) {
    if (name.empty()) {
        ConnectionFilter filter;
        filter.name = "";
        const auto found = client.connection_query(filter);
        if (found.empty()) {
            return std::nullopt;
        }
        return found.front().identifier;
    }
    const auto all_connections = client.connection_query(ConnectionFilter{});
    std::vector<Connection> possible_matches;
    std::copy_if(all_connections.begin(), all_connections.end(), std::back_inserter(possible_matches),
                 [&](const Connection& c) { return !c.name.empty() && c.name.back() == name; });
    if (possible_matches.empty()) {
        return std::nullopt;
    }
    std::stable_sort(possible_matches.begin(), possible_matches.end(),
                     [](const Connection& a, const Connection& b) { return a.name.size() < b.name.size(); });
    if (possible_matches.size() > 1) {
        LOG(warning) << possible_matches.size() << " connections named " << name << ", using " << possible_matches.front().identifier;
    }
    return possible_matches.front().identifier;
}

// Same, failing with CONNECTION_NOT_FOUND
inline std::string require_connection(ApiClient& client, const std::string& name) {
    const auto connection = resolve_connection_name(client, name);
    if (!connection.has_value()) {
        throw TransferError(ErrorKind::CONNECTION_NOT_FOUND, name.empty() ? "no default connection" : "no connection named '" + name + "'");
    }
    LOG(debug) << LOG_ITEM("connection") << connection.value();
    return connection.value();
}
}  // namespace xpipe
