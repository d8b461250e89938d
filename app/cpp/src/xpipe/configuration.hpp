#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <magic_enum.hpp>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

namespace xpipe {
inline constexpr const char* CONFIG_FILE_ENV = "XPIPE_CLI_CONFIG";
inline constexpr const char* CONFIG_FILE_REL = "xpipe-cli/config.yaml";
inline constexpr const char* RELEASE_BASE_URL = "http://127.0.0.1:21721";
inline constexpr const char* PTB_BASE_URL = "http://127.0.0.1:21722";
inline constexpr const char* DEFAULT_LOG_LEVEL = "info";
inline constexpr const std::size_t DEFAULT_CHUNK_SIZE = 1024;
inline constexpr const int ITEM_WIDTH = 12;
// logger
inline boost::log::sources::severity_logger<boost::log::trivial::severity_level> global_logger;
#define LOG(level) BOOST_LOG_SEV(xpipe::global_logger, boost::log::trivial::level)
#define LOG_ITEM(item) std::setw(xpipe::ITEM_WIDTH) << item << ": "

// Settings of one invocation, merged from:
// - built-in defaults
// - the YAML configuration file
// - global options on the command line (highest precedence)
// The first positional argument is the command, the rest are its arguments.
class Configuration {
   public:
    Configuration(
        const int argc,
        const char* const argv[])
        : _init_log(init_log()),
          _config(load_yaml(config_file_path())) {
        parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= log_level());
        LOG(debug) << LOG_ITEM("base url") << base_url();
        LOG(debug) << LOG_ITEM("command") << _command;
    }

    // No log setup and no configuration file lookup
    Configuration(
        const std::vector<std::string>& args,
        const YAML::Node& config)
        : _init_log(false),
          _config(config) {
        parse_arguments(args);
        log_level();
    }

    ~Configuration() {
        if (_init_log) {
            boost::log::core::get()->remove_all_sinks();
        }
    }

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    const std::string& command() const {
        return _command;
    }
    const std::vector<std::string>& command_args() const {
        return _command_args;
    }
    bool help() const {
        return _help;
    }

    bool ptb() const {
        return _ptb || param<bool>({"server", "ptb"}, false);
    }

    std::string base_url() const {
        if (_base_url.has_value()) {
            return _base_url.value();
        }
        const auto url = param<std::string>({"server", "url"}, "");
        if (!url.empty()) {
            return url;
        }
        return ptb() ? PTB_BASE_URL : RELEASE_BASE_URL;
    }

    // API key, none means local authentication
    std::optional<std::string> token() const {
        if (_token.has_value()) {
            return _token;
        }
        const auto token = param<std::string>({"server", "token"}, "");
        if (token.empty()) {
            return std::nullopt;
        }
        return token;
    }

    bool verify() const {
        return !_insecure && param<bool>({"server", "verify"}, true);
    }

    boost::log::trivial::severity_level log_level() const {
        const auto level = _log_level.has_value() ? _log_level.value() : param<std::string>({"misc", "level"}, DEFAULT_LOG_LEVEL);
        auto opt_level = magic_enum::enum_cast<boost::log::trivial::severity_level>(level);
        if (!opt_level.has_value()) {
            throw std::invalid_argument("Invalid log level string: " + level);
        }
        return opt_level.value();
    }

    std::size_t chunk_size() const {
        const auto size = param<std::size_t>({"transfer", "chunk_size"}, DEFAULT_CHUNK_SIZE);
        if (size == 0) {
            throw std::invalid_argument("transfer.chunk_size must be positive");
        }
        return size;
    }

    // Dig to the yaml node by list of keys
    // @param keys list of keys to dig to get the value
    // @param default_value returned when a key is missing
    template <typename T>
    T param(const std::vector<std::string>& keys, const T& default_value) const {
        // Need to clone, else it will be modified in loop
        YAML::Node currentNode = YAML::Clone(_config);
        for (const auto& key : keys) {
            if (!currentNode.IsMap()) {
                return default_value;
            }
            const auto next_node = currentNode[key];
            if (!next_node.IsDefined() || next_node.IsNull()) {
                return default_value;
            }
            currentNode = next_node;
        }
        return currentNode.as<T>();
    }

    // $XPIPE_CLI_CONFIG, else the user configuration folder
    static std::filesystem::path config_file_path() {
        if (const char* explicit_path = std::getenv(CONFIG_FILE_ENV)) {
            return explicit_path;
        }
        if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
            return std::filesystem::path(xdg_config) / CONFIG_FILE_REL;
        }
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / ".config" / CONFIG_FILE_REL;
        }
        return {};
    }

   private:
    // log initialization
    const bool _init_log;
    // config file with parameters (server address, token ...)
    const YAML::Node _config;
    std::string _command;
    std::vector<std::string> _command_args;
    bool _help = false;
    bool _ptb = false;
    bool _insecure = false;
    std::optional<std::string> _base_url;
    std::optional<std::string> _token;
    std::optional<std::string> _log_level;

    // Global options come before the command, everything after belongs to it
    void parse_arguments(const std::vector<std::string>& args) {
        auto it = args.begin();
        for (; it != args.end(); ++it) {
            const std::string& arg = *it;
            if (arg.empty() || arg[0] != '-') {
                break;
            }
            std::string name = arg;
            std::optional<std::string> inline_value;
            const auto equal = arg.find('=');
            if (equal != std::string::npos) {
                name = arg.substr(0, equal);
                inline_value = arg.substr(equal + 1);
            }
            auto value = [&]() -> std::string {
                if (inline_value.has_value()) {
                    return inline_value.value();
                }
                if (++it == args.end()) {
                    throw UsageError("Option " + name + " requires a value");
                }
                return *it;
            };
            if (name == "--ptb") {
                _ptb = true;
            } else if (name == "--insecure") {
                _insecure = true;
            } else if (name == "--base-url") {
                _base_url = value();
            } else if (name == "--token") {
                _token = value();
            } else if (name == "--log-level") {
                _log_level = value();
            } else if (name == "-h" || name == "--help") {
                _help = true;
            } else {
                throw UsageError("Unknown option: " + arg);
            }
        }
        if (it != args.end()) {
            _command = *it++;
            _command_args.assign(it, args.end());
        }
    }

    static YAML::Node load_yaml(const std::filesystem::path& path) {
        if (path.empty() || !std::filesystem::exists(path)) {
            LOG(debug) << LOG_ITEM("config") << "none";
            return YAML::Node();
        }
        LOG(debug) << LOG_ITEM("config") << path.string();
        return YAML::LoadFile(path.string());
    }

    // Initialize the logging system
    static bool init_log() {
        boost::log::add_common_attributes();
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::info);
        boost::log::add_console_log(std::clog)->set_formatter(
            boost::log::expressions::stream
            << std::setw(7) << std::left << boost::log::expressions::attr<boost::log::trivial::severity_level>("Severity") << " "  //
            << boost::log::expressions::smessage);
        return true;
    }
};
}  // namespace xpipe
