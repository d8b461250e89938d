#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>
#include <boost/url/parse.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "configuration.hpp"
#include "errors.hpp"
#include "streams.hpp"

namespace json = boost::json;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

namespace xpipe {
inline constexpr const int HTTP_1_1 = 11;
inline constexpr const char* const MIME_JSON = "application/json";
inline constexpr const char* const MIME_OCTET = "application/octet-stream";
inline const json::value empty_value;

enum BodyType {
    NONE,
    JSON
};

inline std::string attribute_str(const json::object& dict, const std::string& key) {
    const json::string& value = dict.at(key).as_string();
    return std::string(value.data(), value.size());
}

// Server address and path prefix, taken from the base url
struct Target {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path;
};

inline Target parse_target(const std::string& base_url) {
    const auto parsed = boost::urls::parse_uri(base_url);
    if (!parsed) {
        throw std::invalid_argument("Invalid url: " + base_url);
    }
    const auto& base_uri = parsed.value();
    Target target;
    if (base_uri.scheme() == "https") {
        target.tls = true;
    } else if (base_uri.scheme() != "http") {
        throw std::invalid_argument("Unsupported url scheme: " + std::string(base_uri.scheme()));
    }
    target.host = base_uri.host();
    target.port = std::string(base_uri.port());
    if (target.port.empty()) {
        target.port = target.tls ? "443" : "80";
    }
    target.path = base_uri.path();
    while (!target.path.empty() && target.path.back() == '/') {
        target.path.pop_back();
    }
    return target;
}

// Extract the daemon's message from an error body, if any
inline std::string error_message(const std::string& body) {
    boost::system::error_code ec;
    const json::value parsed = json::parse(body, ec);
    if (!ec && parsed.is_object()) {
        const auto& object = parsed.as_object();
        if (const auto* message = object.if_contains("message"); message != nullptr && message->is_string()) {
            return message->as_string().c_str();
        }
    }
    return boost::algorithm::trim_copy(body);
}

namespace detail {
class PlainTransport {
   public:
    PlainTransport(const Target& target, bool)
        : _socket(_io_svc) {
        boost::asio::ip::tcp::resolver resolver(_io_svc);
        boost::asio::connect(_socket, resolver.resolve(target.host, target.port));
    }
    boost::asio::ip::tcp::socket& stream() {
        return _socket;
    }
    void shutdown() {
        boost::system::error_code ec;
        _socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != boost::system::errc::not_connected) {
            throw boost::system::system_error{ec};
        }
    }

   private:
    boost::asio::io_context _io_svc;
    boost::asio::ip::tcp::socket _socket;
};

class TlsTransport {
   public:
    TlsTransport(const Target& target, bool verify)
        : _ssl_context(make_context(verify)),
          _stream(_io_svc, _ssl_context) {
        // Set SNI Hostname (many hosts need this to handshake successfully)
        if (!SSL_set_tlsext_host_name(_stream.native_handle(), target.host.c_str())) {
            boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
            throw boost::system::system_error{ec};
        }
        if (verify) {
            _stream.set_verify_callback(ssl::host_name_verification(target.host));
        }
        boost::asio::ip::tcp::resolver resolver(_io_svc);
        boost::asio::connect(_stream.lowest_layer(), resolver.resolve(target.host, target.port));
        _stream.handshake(ssl::stream_base::handshake_type::client);
    }
    ssl::stream<boost::asio::ip::tcp::socket>& stream() {
        return _stream;
    }
    void shutdown() {
        boost::system::error_code ec;
        _stream.shutdown(ec);
        if (ec == boost::asio::error::eof || ec == ssl::error::stream_truncated) {
            ec.assign(0, ec.category());
        }
        if (ec)
            throw boost::system::system_error{ec};
    }

   private:
    boost::asio::io_context _io_svc;
    ssl::context _ssl_context;
    ssl::stream<boost::asio::ip::tcp::socket> _stream;

    static ssl::context make_context(bool verify) {
        ssl::context ssl_context(ssl::context::tls_client);
        ssl_context.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
        if (verify) {
            ssl_context.set_default_verify_paths();
            ssl_context.set_verify_mode(ssl::verify_peer);
        } else {
            ssl_context.set_verify_mode(ssl::verify_none);
        }
        return ssl_context;
    }
};

// One request, whole response in memory
template <class Transport>
http::response<http::string_body> exchange(const Target& target, bool verify, const http::request<http::string_body>& request) {
    Transport transport(target, verify);
    http::write(transport.stream(), request);
    http::response<http::string_body> response;
    boost::beast::flat_buffer buffer;
    http::read(transport.stream(), buffer, response);
    transport.shutdown();
    return response;
}
}  // namespace detail

// Response whose body is read incrementally
class ResponseStream : public ByteSource {
   public:
    virtual unsigned status() const = 0;
};

template <class Transport>
class BasicResponseStream : public ResponseStream {
   public:
    BasicResponseStream(const Target& target, bool verify, const http::request<http::string_body>& request)
        : _transport(target, verify) {
        _parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::write(_transport.stream(), request);
        http::read_header(_transport.stream(), _buffer, _parser);
        LOG(debug) << "Code: " << _parser.get().result_int();
    }

    unsigned status() const override {
        return _parser.get().result_int();
    }

    std::optional<std::uint64_t> size() const override {
        const auto length = _parser.content_length();
        if (!length) {
            return std::nullopt;
        }
        return *length;
    }

    std::optional<std::string> read(std::size_t max_size) override {
        std::string chunk(max_size, '\0');
        // chunk boundaries of the transfer encoding may yield empty reads
        while (!_parser.is_done()) {
            _parser.get().body().data = chunk.data();
            _parser.get().body().size = chunk.size();
            boost::system::error_code ec;
            http::read(_transport.stream(), _buffer, _parser, ec);
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw boost::system::system_error{ec};
            }
            const std::size_t received = max_size - _parser.get().body().size;
            if (received > 0) {
                chunk.resize(received);
                return chunk;
            }
        }
        return std::nullopt;
    }

   private:
    Transport _transport;
    boost::beast::flat_buffer _buffer;
    http::response_parser<http::buffer_body> _parser;
};

// simple REST client using boost
class Rest {
   private:
    // base url, including possibly path
    const std::string _base_url;
    const Target _target;
    std::unordered_map<http::field, std::string> _headers;
    bool _verify;

   public:
    explicit Rest(std::string base_url)
        : _base_url(base_url),
          _target(parse_target(_base_url)),
          _headers(),
          _verify(true) {
    }
    const std::string& base_url() const {
        return _base_url;
    }
    void set_verify(bool verify) {
        _verify = verify;
    }

    void set_auth_bearer(const std::string& token) {
        _headers.insert_or_assign(http::field::authorization, "Bearer " + token);
    }

    json::value call(
        const http::verb method,
        const std::string& endpoint = "",
        const json::value& body = empty_value,
        BodyType body_type = BodyType::NONE  //
    ) {
        LOG(debug) << "Calling: " << method << " on " << endpoint;
        auto request = build_request(method, endpoint);
        switch (body_type) {
            case BodyType::NONE:
                break;
            case BodyType::JSON:
                request.set(http::field::content_type, MIME_JSON);
                request.body() = json::serialize(body);
                request.prepare_payload();
                break;
        }
        LOG(trace) << "Request: " << request;
        const auto response = send(request);
        LOG(debug) << "Code: " << response.result_int();
        // check HTTP status is success
        if (response.result_int() >= 300) {
            LOG(debug) << "Response: " << response.body();
            throw ApiError(response.result_int(), error_message(response.body()));
        }
        LOG(trace) << "Result: " << response.body();
        if (response.body().empty()) {
            return empty_value;
        }
        return json::parse(response.body());
    }
    json::value create(const std::string& endpoint, const json::value& body) {
        return call(http::verb::post, endpoint, body, BodyType::JSON);
    }
    // Raw bytes as request body, JSON result
    json::value upload(const std::string& endpoint, const std::string& data) {
        LOG(debug) << "Uploading " << data.size() << " bytes to " << endpoint;
        auto request = build_request(http::verb::post, endpoint);
        request.set(http::field::content_type, MIME_OCTET);
        request.body() = data;
        request.prepare_payload();
        const auto response = send(request);
        LOG(debug) << "Code: " << response.result_int();
        if (response.result_int() >= 300) {
            throw ApiError(response.result_int(), error_message(response.body()));
        }
        if (response.body().empty()) {
            return empty_value;
        }
        return json::parse(response.body());
    }
    // JSON request, response body left on the wire for the caller to read
    std::unique_ptr<ResponseStream> open(const http::verb method, const std::string& endpoint, const json::value& body) {
        LOG(debug) << "Opening: " << method << " on " << endpoint;
        auto request = build_request(method, endpoint);
        request.set(http::field::content_type, MIME_JSON);
        request.set(http::field::accept, MIME_OCTET);
        request.body() = json::serialize(body);
        request.prepare_payload();
        std::unique_ptr<ResponseStream> stream;
        if (_target.tls) {
            stream = std::make_unique<BasicResponseStream<detail::TlsTransport>>(_target, _verify, request);
        } else {
            stream = std::make_unique<BasicResponseStream<detail::PlainTransport>>(_target, _verify, request);
        }
        if (stream->status() >= 300) {
            throw ApiError(stream->status(), error_message(read_all(*stream, 4096)));
        }
        return stream;
    }

    static std::string read_file(const std::string& file_path) {
        std::ifstream file_stream(file_path);
        if (!file_stream.is_open()) {
            throw std::runtime_error("Could not open file: " + file_path);
        }
        return std::string((std::istreambuf_iterator<char>(file_stream)), std::istreambuf_iterator<char>());
    }

   private:
    http::request<http::string_body> build_request(const http::verb method, const std::string& endpoint) const {
        std::string endpoint_full_path = _target.path;
        if (!endpoint.empty())
            endpoint_full_path += "/" + endpoint;
        if (endpoint_full_path.empty())
            endpoint_full_path = "/";
        http::request<http::string_body> request{method, endpoint_full_path, HTTP_1_1};
        request.set(http::field::host, _target.host);
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        if (method == http::verb::post || method == http::verb::get) {
            request.set(http::field::accept, MIME_JSON);
        }
        for (const auto& [key, value] : _headers) {
            request.set(key, value);
        }
        return request;
    }

    http::response<http::string_body> send(const http::request<http::string_body>& request) const {
        if (_target.tls) {
            return detail::exchange<detail::TlsTransport>(_target, _verify, request);
        }
        return detail::exchange<detail::PlainTransport>(_target, _verify, request);
    }
};
}  // namespace xpipe
