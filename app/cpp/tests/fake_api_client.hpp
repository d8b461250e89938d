#pragma once

#include <xpipe/api_client.hpp>
#include <xpipe/streams.hpp>

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Remote file served by FakeApiClient::fs_read
struct FakeRemoteFile {
    std::vector<std::string> chunks;
    // Content-Length sent by the transport, none for chunked responses
    std::optional<std::uint64_t> declared_length;
    // throw after this many chunks
    std::optional<std::size_t> fail_after;
};

class FakeChunkSource : public xpipe::ByteSource {
public:
    explicit FakeChunkSource(const FakeRemoteFile& file) : file_(file) {}

    std::optional<std::string> read(std::size_t max_size) override {
        if (file_.fail_after && index_ == *file_.fail_after) {
            throw std::runtime_error("connection reset");
        }
        if (index_ >= file_.chunks.size()) return std::nullopt;
        // the engine's chunk size caps what one read returns
        std::string& current = file_.chunks[index_];
        std::string chunk = current.substr(0, max_size);
        current.erase(0, chunk.size());
        if (current.empty()) ++index_;
        return chunk;
    }

    std::optional<std::uint64_t> size() const override { return file_.declared_length; }

private:
    FakeRemoteFile file_;
    std::size_t index_ = 0;
};

// In-memory daemon recording every call
class FakeApiClient : public xpipe::ApiClient {
public:
    std::vector<xpipe::Connection> connections;
    // results of connection_query when the name filter is ""
    std::vector<xpipe::Connection> default_connections;
    std::map<std::string, FakeRemoteFile> files;
    std::map<std::string, xpipe::ExecResult> exec_results;

    std::vector<std::string> calls;
    std::vector<xpipe::ConnectionFilter> queries;
    std::vector<std::string> uploaded_blobs;
    std::map<std::string, std::string> written_files;

    bool fail_start = false;
    bool fail_stop = false;
    bool fail_exec = false;
    bool fail_read = false;
    bool fail_blob = false;
    bool fail_write = false;

    int starts = 0;
    int stops = 0;

    std::vector<xpipe::Connection> connection_query(const xpipe::ConnectionFilter& filter) override {
        calls.push_back("query");
        queries.push_back(filter);
        if (filter.name.empty()) return default_connections;
        return connections;
    }

    void shell_start(const std::string& connection) override {
        calls.push_back("start " + connection);
        if (fail_start) throw std::runtime_error("cannot start shell");
        ++starts;
    }

    void shell_stop(const std::string& connection) override {
        calls.push_back("stop " + connection);
        ++stops;
        if (fail_stop) throw std::runtime_error("cannot stop shell");
    }

    xpipe::ExecResult shell_exec(const std::string& connection, const std::string& command) override {
        calls.push_back("exec " + connection + " " + command);
        if (fail_exec) throw std::runtime_error("exec timed out");
        auto it = exec_results.find(command);
        if (it == exec_results.end()) return xpipe::ExecResult{"", "command not found", 127};
        return it->second;
    }

    std::unique_ptr<xpipe::ByteSource> fs_read(const std::string& connection, const std::string& path) override {
        calls.push_back("read " + connection + " " + path);
        if (fail_read) throw std::runtime_error("HTTP error: 500");
        auto it = files.find(path);
        if (it == files.end()) throw std::runtime_error("HTTP error: 404");
        return std::make_unique<FakeChunkSource>(it->second);
    }

    std::string fs_blob(const std::string& data) override {
        calls.push_back("blob");
        if (fail_blob) throw std::runtime_error("HTTP error: 413");
        uploaded_blobs.push_back(data);
        return "blob-" + std::to_string(uploaded_blobs.size());
    }

    void fs_write(const std::string& connection, const std::string& blob, const std::string& path) override {
        calls.push_back("write " + connection + " " + blob + " " + path);
        if (fail_write) throw std::runtime_error("permission denied");
        const auto index = std::stoul(blob.substr(5)) - 1;
        written_files[path] = uploaded_blobs.at(index);
    }

    int count_calls(const std::string& prefix) const {
        int count = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) ++count;
        }
        return count;
    }
};

inline xpipe::Connection make_connection(const std::string& id, std::vector<std::string> name,
                                         const std::string& type = "ssh") {
    xpipe::Connection c;
    c.identifier = id;
    c.name = std::move(name);
    c.category = {"default"};
    c.type = type;
    return c;
}
