#pragma once

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "api_client.hpp"
#include "configuration.hpp"
#include "errors.hpp"

namespace xpipe {

// Quote a path for a POSIX shell
inline std::string shell_quote(const std::string& text) {
    return "'" + boost::algorithm::replace_all_copy(text, "'", "'\\''") + "'";
}

// Remote shell started on construction and stopped exactly once:
// explicitly with stop(), which reports failures, or else on destruction,
// where failures are only logged so an earlier error keeps propagating.
class ShellSession {
   public:
    ShellSession(ApiClient& client, std::string connection)
        : _client(client),
          _connection(std::move(connection)),
          _active(false) {
        LOG(debug) << "Starting shell on " << _connection;
        with_error_kind(ErrorKind::SESSION_ERROR, "starting shell on " + _connection, [&] { _client.shell_start(_connection); });
        _active = true;
    }

    ~ShellSession() {
        if (!_active) {
            return;
        }
        try {
            stop();
        } catch (const std::exception& e) {
            LOG(error) << e.what();
        }
    }

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    const std::string& connection() const {
        return _connection;
    }

    ExecResult exec(const std::string& command) {
        LOG(debug) << LOG_ITEM("exec") << command;
        return with_error_kind(ErrorKind::SESSION_ERROR, "executing on " + _connection, [&] { return _client.shell_exec(_connection, command); });
    }

    // Remote file size from stat, none on any failure
    std::optional<std::uint64_t> probe_size(const std::string& path) {
        try {
            const ExecResult result = exec("stat -c %s " + shell_quote(path));
            if (result.exit_code != 0) {
                throw std::runtime_error("stat exited with " + std::to_string(result.exit_code) + ": " + boost::algorithm::trim_copy(result.std_err));
            }
            const std::string text = boost::algorithm::trim_copy(result.std_out);
            if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
                throw std::runtime_error("unexpected stat output: " + text);
            }
            return boost::lexical_cast<std::uint64_t>(text);
        } catch (const std::exception& e) {
            LOG(debug) << magic_enum::enum_name(ErrorKind::PROBE_FAILED) << ": " << e.what();
            return std::nullopt;
        }
    }

    void stop() {
        if (!_active) {
            return;
        }
        _active = false;
        LOG(debug) << "Stopping shell on " << _connection;
        with_error_kind(ErrorKind::SESSION_ERROR, "stopping shell on " + _connection, [&] { _client.shell_stop(_connection); });
    }

   private:
    ApiClient& _client;
    const std::string _connection;
    bool _active;
};
}  // namespace xpipe
