#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "api_client.hpp"
#include "configuration.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "resolver.hpp"
#include "shell_session.hpp"
#include "streams.hpp"

namespace xpipe {

// <connection>:<path>, split on the last colon
struct RemoteReference {
    std::string connection;
    std::string path;
};

inline RemoteReference parse_reference(const std::string& reference) {
    const auto separator = reference.rfind(':');
    if (separator == std::string::npos) {
        throw TransferError(ErrorKind::INVALID_REFERENCE, "expected <connection>:<path>, got '" + reference + "'");
    }
    return {reference.substr(0, separator), reference.substr(separator + 1)};
}

// Moves single files between local streams and connections, and runs commands.
// Every operation resolves the connection, then runs inside its own shell
// session, which is stopped on all exit paths.
class TransferEngine {
   private:
    ApiClient& _client;
    const std::size_t _chunk_size;
    ProgressListener* _listener;

   public:
    explicit TransferEngine(ApiClient& client, std::size_t chunk_size = DEFAULT_CHUNK_SIZE, ProgressListener* listener = nullptr)
        : _client(client),
          _chunk_size(chunk_size),
          _listener(listener) {
    }

    // Copy a remote file into local, chunk by chunk
    // @param remote <connection>:<path>
    void pull(const std::string& remote, ByteSink& local) {
        const RemoteReference reference = parse_reference(remote);
        const std::string connection = require_connection(_client, reference.connection);
        ShellSession session(_client, connection);
        {
            ProgressTracker progress(_listener);
            progress.set_total(session.probe_size(reference.path));
            auto remote_stream = with_error_kind(ErrorKind::TRANSFER_IO_ERROR, "opening " + remote, [&] {
                return _client.fs_read(connection, reference.path);
            });
            // the length announced by the transport wins over the probe
            if (const auto length = remote_stream->size()) {
                progress.set_total(length);
            }
            with_error_kind(ErrorKind::TRANSFER_IO_ERROR, "copying " + remote, [&] {
                while (auto chunk = remote_stream->read(_chunk_size)) {
                    local.write(chunk.value());
                    progress.advance(chunk->size());
                }
                local.flush();
            });
            progress.finish();
            LOG(info) << "Pulled " << progress.state().transferred << " bytes from " << remote;
        }
        session.stop();
    }

    // Upload local as a whole, then have the server write it to the remote path
    // @param remote <connection>:<path>
    void push(ByteSource& local, const std::string& remote) {
        const RemoteReference reference = parse_reference(remote);
        const std::string connection = require_connection(_client, reference.connection);
        ShellSession session(_client, connection);
        {
            ProgressTracker progress(_listener);
            // no chunked upload endpoint: the file is buffered entirely
            const std::string data = with_error_kind(ErrorKind::TRANSFER_IO_ERROR, "reading local data", [&] {
                return read_all(local, _chunk_size);
            });
            progress.set_total(data.size());
            const std::string blob = with_error_kind(ErrorKind::TRANSFER_IO_ERROR, "uploading blob", [&] {
                return _client.fs_blob(data);
            });
            progress.advance(data.size());
            LOG(debug) << LOG_ITEM("blob") << blob;
            with_error_kind(ErrorKind::TRANSFER_IO_ERROR, "writing " + remote, [&] {
                _client.fs_write(connection, blob, reference.path);
            });
            progress.finish();
            LOG(info) << "Pushed " << data.size() << " bytes to " << remote;
        }
        session.stop();
    }

    // Run one command on the named connection
    ExecResult exec(const std::string& connection_name, const std::string& command) {
        const std::string connection = require_connection(_client, connection_name);
        ShellSession session(_client, connection);
        ExecResult result = session.exec(command);
        session.stop();
        return result;
    }
};

// What exec shows: stdout alone when raw, else the whole result as JSON
inline std::string exec_output(const ExecResult& result, bool raw) {
    if (raw) {
        return result.std_out;
    }
    return json::serialize(to_json(result)) + "\n";
}
}  // namespace xpipe
