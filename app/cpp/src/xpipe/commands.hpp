#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "configuration.hpp"
#include "errors.hpp"
#include "listing.hpp"
#include "progress.hpp"
#include "streams.hpp"
#include "transfer_engine.hpp"

namespace xpipe {
// local path standing for stdin / stdout
inline constexpr const char* STANDARD_STREAM = "-";

inline const char* const USAGE =
    "Usage: xpipe-cli [--ptb] [--base-url URL] [--token TOKEN] [--log-level LEVEL] [--insecure] COMMAND [ARGS]\n"
    "\n"
    "Commands:\n"
    "  ls [-c|--category GLOB] [-n|--name GLOB] [--type GLOB]\n"
    "     [-f|--output-format text|html|json|csv|latex] [--sort-by name|type|category|uuid] [--reverse]\n"
    "                                      List connections, with optional filters\n"
    "  pull <connection>:<remote> <local>  Read a remote file into LOCAL ('-' for stdout)\n"
    "  push <local> <connection>:<remote>  Write LOCAL ('-' for stdin) to a remote file\n"
    "  exec [--raw] <connection> [--] <command>\n"
    "                                      Execute a command on a connection\n";

struct LsCommand {
    ConnectionFilter filter;
    ListingOptions listing;
};

struct ExecCommand {
    std::string connection;
    std::string command;
    bool raw = false;
};

inline LsCommand parse_ls_arguments(const std::vector<std::string>& args) {
    LsCommand parsed;
    for (auto it = args.begin(); it != args.end(); ++it) {
        const std::string& arg = *it;
        auto value = [&]() -> std::string {
            if (++it == args.end()) {
                throw UsageError("Option " + arg + " requires a value");
            }
            return *it;
        };
        if (arg == "-c" || arg == "--category") {
            parsed.filter.category = value();
        } else if (arg == "-n" || arg == "--name") {
            parsed.filter.name = value();
        } else if (arg == "--type") {
            parsed.filter.type = value();
        } else if (arg == "-f" || arg == "--output-format") {
            parsed.listing.format = parse_choice<OutputFormat>(arg, value());
        } else if (arg == "--sort-by") {
            parsed.listing.sort_by = parse_choice<SortField>(arg, value());
        } else if (arg == "--reverse") {
            parsed.listing.reverse = true;
        } else {
            throw UsageError("Unexpected argument for ls: " + arg);
        }
    }
    return parsed;
}

// --raw anywhere before "--", everything after "--" is positional
inline ExecCommand parse_exec_arguments(const std::vector<std::string>& args) {
    ExecCommand parsed;
    std::vector<std::string> positional;
    bool options_done = false;
    for (const auto& arg : args) {
        if (options_done) {
            positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--raw") {
            parsed.raw = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        throw UsageError("exec expects <connection> <command>");
    }
    parsed.connection = positional[0];
    parsed.command = positional[1];
    return parsed;
}

// Dispatches one command line to the API client
// @return process exit code
class CommandRunner {
   private:
    ApiClient& _client;
    const std::size_t _chunk_size;
    std::ostream& _out;
    std::ostream& _err;

   public:
    CommandRunner(ApiClient& client, std::size_t chunk_size, std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : _client(client),
          _chunk_size(chunk_size),
          _out(out),
          _err(err) {
    }

    int run(const std::string& command, const std::vector<std::string>& args) {
        if (command == "ls") {
            return ls(parse_ls_arguments(args));
        }
        if (command == "pull") {
            expect_arguments(command, args, "<connection>:<remote> <local>");
            return pull(args[0], args[1]);
        }
        if (command == "push") {
            expect_arguments(command, args, "<local> <connection>:<remote>");
            return push(args[0], args[1]);
        }
        if (command == "exec") {
            return exec(parse_exec_arguments(args));
        }
        throw UsageError("Unknown command: " + command);
    }

    int ls(const LsCommand& command) {
        const auto connections = _client.connection_query(command.filter);
        _out << render_connections(connections, command.listing);
        return 0;
    }

    int pull(const std::string& remote, const std::string& local) {
        if (local == STANDARD_STREAM) {
            StreamSink sink(_out);
            TransferEngine(_client, _chunk_size).pull(remote, sink);
            return 0;
        }
        FileSink sink(local);
        ProgressBar progress_bar(_err);
        TransferEngine(_client, _chunk_size, &progress_bar).pull(remote, sink);
        return 0;
    }

    int push(const std::string& local, const std::string& remote) {
        ProgressBar progress_bar(_err);
        if (local == STANDARD_STREAM) {
            StreamSource source(std::cin);
            TransferEngine(_client, _chunk_size, &progress_bar).push(source, remote);
            return 0;
        }
        FileSource source(local);
        TransferEngine(_client, _chunk_size, &progress_bar).push(source, remote);
        return 0;
    }

    int exec(const ExecCommand& command) {
        const ExecResult result = TransferEngine(_client, _chunk_size).exec(command.connection, command.command);
        _out << exec_output(result, command.raw) << std::flush;
        return static_cast<int>(result.exit_code & 0xff);
    }

   private:
    static void expect_arguments(const std::string& command, const std::vector<std::string>& args, const std::string& expected) {
        if (args.size() != 2) {
            throw UsageError(command + " expects " + expected);
        }
    }
};
}  // namespace xpipe
