#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace xpipe {

// Lazy, finite sequence of byte chunks, consumed once
class ByteSource {
   public:
    virtual ~ByteSource() = default;
    // @param max_size upper bound of the returned chunk
    // @return next non-empty chunk, or none at end of data
    virtual std::optional<std::string> read(std::size_t max_size) = 0;
    // Declared total length, when known up front
    virtual std::optional<std::uint64_t> size() const {
        return std::nullopt;
    }
};

class ByteSink {
   public:
    virtual ~ByteSink() = default;
    virtual void write(const std::string& data) = 0;
    virtual void flush() {}
};

// Reads from a stream owned by the caller (std::cin ...)
class StreamSource : public ByteSource {
   public:
    explicit StreamSource(std::istream& input)
        : _input(input) {
    }
    std::optional<std::string> read(std::size_t max_size) override {
        std::string chunk(max_size, '\0');
        _input.read(chunk.data(), static_cast<std::streamsize>(max_size));
        if (_input.bad()) {
            throw std::ios_base::failure("Failed to read input");
        }
        chunk.resize(static_cast<std::size_t>(_input.gcount()));
        if (chunk.empty()) {
            return std::nullopt;
        }
        return chunk;
    }

   private:
    std::istream& _input;
};

class FileSource : public StreamSource {
   public:
    explicit FileSource(const std::filesystem::path& path)
        : StreamSource(_file),
          _file(path, std::ios::binary),
          _size(std::nullopt) {
        if (!_file.is_open()) {
            throw std::runtime_error("Could not open file: " + path.string());
        }
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(path, ec);
        if (!ec) {
            _size = file_size;
        }
    }
    std::optional<std::uint64_t> size() const override {
        return _size;
    }

   private:
    std::ifstream _file;
    std::optional<std::uint64_t> _size;
};

// Writes to a stream owned by the caller (std::cout ...)
class StreamSink : public ByteSink {
   public:
    explicit StreamSink(std::ostream& output)
        : _output(output) {
    }
    void write(const std::string& data) override {
        _output.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!_output) {
            throw std::ios_base::failure("Failed to write output");
        }
    }
    void flush() override {
        _output.flush();
        if (!_output) {
            throw std::ios_base::failure("Failed to flush output");
        }
    }

   private:
    std::ostream& _output;
};

// Opened, and truncated, on the first write or flush only:
// a transfer failing before any data leaves an existing file untouched.
class FileSink : public ByteSink {
   public:
    explicit FileSink(const std::filesystem::path& path)
        : _path(path) {
    }
    void write(const std::string& data) override {
        stream().write(data);
    }
    void flush() override {
        stream().flush();
    }
    bool is_open() const {
        return _file.is_open();
    }

   private:
    std::filesystem::path _path;
    std::ofstream _file;
    std::unique_ptr<StreamSink> _sink;

    StreamSink& stream() {
        if (!_sink) {
            _file.open(_path, std::ios::binary | std::ios::trunc);
            if (!_file.is_open()) {
                throw std::runtime_error("Could not open file for writing: " + _path.string());
            }
            _sink = std::make_unique<StreamSink>(_file);
        }
        return *_sink;
    }
};

class StringSource : public ByteSource {
   public:
    explicit StringSource(std::string data)
        : _data(std::move(data)),
          _offset(0) {
    }
    std::optional<std::string> read(std::size_t max_size) override {
        if (_offset >= _data.size()) {
            return std::nullopt;
        }
        std::string chunk = _data.substr(_offset, max_size);
        _offset += chunk.size();
        return chunk;
    }
    std::optional<std::uint64_t> size() const override {
        return _data.size();
    }

   private:
    const std::string _data;
    std::size_t _offset;
};

class StringSink : public ByteSink {
   public:
    void write(const std::string& data) override {
        _data += data;
    }
    const std::string& data() const {
        return _data;
    }

   private:
    std::string _data;
};

// Drain a source into memory
inline std::string read_all(ByteSource& source, std::size_t chunk_size) {
    std::string data;
    if (const auto expected = source.size()) {
        data.reserve(static_cast<std::size_t>(expected.value()));
    }
    while (auto chunk = source.read(chunk_size)) {
        data += chunk.value();
    }
    return data;
}
}  // namespace xpipe
