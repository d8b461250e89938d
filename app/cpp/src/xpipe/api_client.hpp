#pragma once

#include <boost/algorithm/string/trim.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "rest.hpp"
#include "streams.hpp"

namespace json = boost::json;

namespace xpipe {
inline constexpr const char* CLIENT_NAME = "xpipe-cli";
inline constexpr const char* AUTH_FILE = "xpipe_auth";
inline constexpr const char* PTB_AUTH_FILE = "xpipe_ptb_auth";

// Server-side record of one managed host
struct Connection {
    std::string identifier;
    // hierarchical display name, outermost group first
    std::vector<std::string> name;
    std::vector<std::string> category;
    std::string type;
};

// Glob patterns, "*" matches everything
struct ConnectionFilter {
    std::string category = "*";
    std::string name = "*";
    std::string type = "*";
};

struct ExecResult {
    std::string std_out;
    std::string std_err;
    std::int64_t exit_code = 0;
};

inline std::vector<std::string> attribute_strings(const json::object& dict, const std::string& key) {
    std::vector<std::string> values;
    for (const auto& item : dict.at(key).as_array()) {
        values.emplace_back(item.as_string().c_str());
    }
    return values;
}

inline Connection connection_from_json(const json::object& entry) {
    Connection connection;
    connection.identifier = attribute_str(entry, "connection");
    connection.name = attribute_strings(entry, "name");
    connection.category = attribute_strings(entry, "category");
    connection.type = attribute_str(entry, "type");
    return connection;
}

inline ExecResult exec_result_from_json(const json::object& entry) {
    ExecResult result;
    result.exit_code = entry.at("exitCode").to_number<std::int64_t>();
    result.std_out = attribute_str(entry, "stdout");
    result.std_err = attribute_str(entry, "stderr");
    return result;
}

inline json::object to_json(const ExecResult& result) {
    return {
        {"exitCode", result.exit_code},
        {"stdout", result.std_out},
        {"stderr", result.std_err}};
}

// Operations of the XPipe daemon used by the client
class ApiClient {
   public:
    virtual ~ApiClient() = default;
    virtual std::vector<Connection> connection_query(const ConnectionFilter& filter) = 0;
    virtual void shell_start(const std::string& connection) = 0;
    virtual void shell_stop(const std::string& connection) = 0;
    virtual ExecResult shell_exec(const std::string& connection, const std::string& command) = 0;
    // Remote file content, size() is the declared length when the server sent one
    virtual std::unique_ptr<ByteSource> fs_read(const std::string& connection, const std::string& path) = 0;
    // Stage bytes on the server, returns the blob id
    virtual std::string fs_blob(const std::string& data) = 0;
    virtual void fs_write(const std::string& connection, const std::string& blob, const std::string& path) = 0;
};

// ApiClient over the daemon's HTTP API
// A session token is obtained with a handshake before the first call.
class HttpApiClient : public ApiClient {
   private:
    Rest _api;
    const std::optional<std::string> _token;
    const bool _ptb;
    bool _has_session;

   public:
    explicit HttpApiClient(const Configuration& config)
        : _api(config.base_url()),
          _token(config.token()),
          _ptb(config.ptb()),
          _has_session(false) {
        _api.set_verify(config.verify());
    }

    std::vector<Connection> connection_query(const ConnectionFilter& filter) override {
        const json::value response = post(
            "connection/query",
            {{"categoryFilter", filter.category},
             {"connectionFilter", filter.name},
             {"typeFilter", filter.type}});
        std::vector<Connection> connections;
        for (const auto& entry : response.as_object().at("found").as_array()) {
            connections.push_back(connection_from_json(entry.as_object()));
        }
        LOG(debug) << LOG_ITEM("found") << connections.size();
        return connections;
    }

    void shell_start(const std::string& connection) override {
        const json::value response = post("shell/start", {{"connection", connection}});
        LOG(debug) << LOG_ITEM("shell") << response;
    }

    void shell_stop(const std::string& connection) override {
        post("shell/stop", {{"connection", connection}});
    }

    ExecResult shell_exec(const std::string& connection, const std::string& command) override {
        const json::value response = post("shell/exec", {{"connection", connection}, {"command", command}});
        return exec_result_from_json(response.as_object());
    }

    std::unique_ptr<ByteSource> fs_read(const std::string& connection, const std::string& path) override {
        ensure_session();
        return _api.open(http::verb::post, "fs/read", json::object{{"connection", connection}, {"path", path}});
    }

    std::string fs_blob(const std::string& data) override {
        ensure_session();
        const json::value response = _api.upload("fs/blob", data);
        return attribute_str(response.as_object(), "blob");
    }

    void fs_write(const std::string& connection, const std::string& blob, const std::string& path) override {
        post("fs/write", {{"connection", connection}, {"blob", blob}, {"path", path}});
    }

    // Auth file written by a locally running daemon
    static std::filesystem::path local_auth_file(bool ptb) {
        return std::filesystem::temp_directory_path() / (ptb ? PTB_AUTH_FILE : AUTH_FILE);
    }

   private:
    json::value post(const std::string& endpoint, const json::object& body) {
        ensure_session();
        return _api.create(endpoint, body);
    }

    void ensure_session() {
        if (!_has_session) {
            handshake();
        }
    }

    void handshake() {
        json::object auth;
        if (_token.has_value()) {
            auth = {{"type", "ApiKey"}, {"key", _token.value()}};
        } else {
            const auto auth_file = local_auth_file(_ptb);
            LOG(debug) << LOG_ITEM("auth file") << auth_file.string();
            auth = {{"type", "Local"}, {"authFileContent", boost::algorithm::trim_copy(Rest::read_file(auth_file.string()))}};
        }
        LOG(info) << "Connecting to " << _api.base_url();
        const json::value response = _api.create(
            "handshake",
            {{"auth", auth},
             {"client", {{"type", "Api"}, {"name", CLIENT_NAME}}}});
        _api.set_auth_bearer(attribute_str(response.as_object(), "sessionToken"));
        _has_session = true;
    }
};
}  // namespace xpipe
