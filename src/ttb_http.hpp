/*
 * File: src/ttb_http.hpp
 * Project: TTB Broker Proxy
 * Purpose: HTTP(S) transport towards brokers
 * Notes:
 *  - See DESIGN.md
 *  - One connection per request, no keep-alive
 *  - Every step (connect, handshake, write, read) is bounded by the request timeout
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "common/target.hpp"

namespace http = boost::beast::http;

// Trust policy for a broker's certificate
struct TlsPolicy
{
    enum class Mode
    {
        verify,   // system trust store + host name check
        skip,     // self-signed brokers
        ca_bundle // trust only `ca_path`
    };
    Mode mode = Mode::verify;
    std::string ca_path;
};

struct ParsedUrl
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string path{"/"};

    bool tls() const { return scheme == "https"; }
    bool default_port() const { return port == (tls() ? "443" : "80"); }
    std::string origin() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        return scheme + "://" + h + (default_port() ? "" : ":" + port);
    }
};

// expects http[s]://host[:port][/path]; IPv6 hosts in brackets
inline ParsedUrl parse_url(const std::string &url)
{
    ParsedUrl u;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw std::runtime_error(url + ": URL has no scheme");
    u.scheme = url.substr(0, scheme_pos);
    for (auto &c : u.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (u.scheme != "http" && u.scheme != "https")
        throw std::runtime_error(url + ": unsupported scheme '" + u.scheme + "'");

    auto rest = url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    u.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto at = hp.rfind('@'); // user:password@ is never sent
    if (at != std::string::npos)
        hp = hp.substr(at + 1);

    std::string port;
    if (!hp.empty() && hp.front() == '[')
    {
        auto close = hp.find(']');
        if (close == std::string::npos)
            throw std::runtime_error(url + ": unterminated IPv6 address");
        u.host = hp.substr(1, close - 1);
        if (close + 1 < hp.size() && hp[close + 1] == ':')
            port = hp.substr(close + 2);
    }
    else
    {
        auto colon = hp.find(':');
        u.host = hp.substr(0, colon);
        if (colon != std::string::npos)
            port = hp.substr(colon + 1);
    }
    if (u.host.empty())
        throw std::runtime_error(url + ": URL has no host");
    u.port = port.empty() ? (u.tls() ? "443" : "80") : port;
    return u;
}

// short name for a broker: the host name sans domain
inline std::string default_aka(const std::string &url)
{
    auto host = parse_url(url).host;
    return host.substr(0, host.find('.'));
}

// Form fields encode a space as '+'; path segments (form == false) as %20
inline std::string url_encode(const std::string &s, bool form = true)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out += static_cast<char>(c);
        else if (c == ' ' && form)
            out += '+';
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

using FormData = std::vector<std::pair<std::string, std::string>>;

inline std::string form_encode(const FormData &form)
{
    std::string out;
    for (const auto &[k, v] : form)
    {
        if (!out.empty())
            out += '&';
        out += url_encode(k) + "=" + url_encode(v);
    }
    return out;
}

struct HttpRequest
{
    http::verb method = http::verb::get;
    std::string url; // absolute
    FormData form;   // sent as the urlencoded body when not empty
    std::string cookie;
    std::chrono::seconds timeout{480};
};

struct HttpResponse
{
    unsigned status = 0;
    std::string body;
    std::vector<std::string> set_cookie; // raw Set-Cookie header values

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // Any HTTP status is a response; throws BrokerError(unreachable) when
    // no response could be obtained (DNS, connect, TLS, timeout).
    virtual HttpResponse send(const HttpRequest &req) = 0;
};

// target listings of big labs run into megabytes
constexpr std::uint64_t kMaxResponseBytes = 64ull * 1024 * 1024;

class BeastTransport : public HttpTransport
{
    TlsPolicy tls_;
    boost::asio::ssl::context ssl_ctx_;

public:
    explicit BeastTransport(TlsPolicy tls)
        : tls_(std::move(tls)), ssl_ctx_(make_ssl_context(tls_)) {}

    HttpResponse send(const HttpRequest &r) override
    {
        ParsedUrl u;
        try
        {
            u = parse_url(r.url);
        }
        catch (const std::runtime_error &e)
        {
            throw BrokerError(ErrorKind::unreachable, e.what());
        }

        http::request<http::string_body> req{r.method, u.path, 11};
        req.set(http::field::host, u.default_port() ? u.host : u.host + ":" + u.port);
        req.set(http::field::user_agent, "ttbproxy-beast");
        req.set(http::field::accept, "application/json");
        if (!r.cookie.empty())
            req.set(http::field::cookie, r.cookie);
        if (!r.form.empty())
        {
            req.set(http::field::content_type, "application/x-www-form-urlencoded");
            req.body() = form_encode(r.form);
        }
        req.prepare_payload();

        // fresh io_context per call: brokers are queried from several threads
        boost::asio::io_context ioc;
        try
        {
            return u.tls() ? exchange_tls(ioc, u, req, r.timeout) : exchange_plain(ioc, u, req, r.timeout);
        }
        catch (const boost::system::system_error &e)
        {
            throw BrokerError(ErrorKind::unreachable, r.url + ": " + e.code().message());
        }
    }

private:
    static boost::asio::ssl::context make_ssl_context(const TlsPolicy &tls)
    {
        namespace ssl = boost::asio::ssl;
        ssl::context ctx{ssl::context::tls_client};
        switch (tls.mode)
        {
        case TlsPolicy::Mode::skip:
            ctx.set_verify_mode(ssl::verify_none);
            break;
        case TlsPolicy::Mode::ca_bundle:
            ctx.load_verify_file(tls.ca_path);
            ctx.set_verify_mode(ssl::verify_peer);
            break;
        case TlsPolicy::Mode::verify:
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);
            break;
        }
        return ctx;
    }

    // Runs one async step to completion; tcp_stream expiry only applies
    // to async operations
    template <class Op>
    static void run_step(boost::asio::io_context &ioc, Op &&op)
    {
        boost::system::error_code ec;
        op([&ec](boost::system::error_code e, auto &&...) { ec = e; });
        ioc.restart();
        ioc.run();
        if (ec)
            throw boost::system::system_error(ec);
    }

    template <class Stream>
    static HttpResponse roundtrip(boost::asio::io_context &ioc, Stream &stream, boost::beast::tcp_stream &lowest,
                                  http::request<http::string_body> &req, std::chrono::seconds timeout)
    {
        lowest.expires_after(timeout);
        run_step(ioc, [&](auto h) { http::async_write(stream, req, h); });

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxResponseBytes);
        lowest.expires_after(timeout);
        run_step(ioc, [&](auto h) { http::async_read(stream, buffer, parser, h); });

        auto res = parser.release();
        HttpResponse out;
        out.status = res.result_int();
        out.body = std::move(res.body());
        for (const auto &f : res)
            if (f.name() == http::field::set_cookie)
                out.set_cookie.emplace_back(f.value().data(), f.value().size());
        return out;
    }

    HttpResponse exchange_plain(boost::asio::io_context &ioc, const ParsedUrl &u,
                                http::request<http::string_body> &req, std::chrono::seconds timeout)
    {
        boost::asio::ip::tcp::resolver resolver{ioc};
        auto const results = resolver.resolve(u.host, u.port);
        boost::beast::tcp_stream stream{ioc};
        stream.expires_after(timeout);
        run_step(ioc, [&](auto h) { stream.async_connect(results, h); });

        auto out = roundtrip(ioc, stream, stream, req, timeout);
        boost::system::error_code ignored;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        return out;
    }

    HttpResponse exchange_tls(boost::asio::io_context &ioc, const ParsedUrl &u,
                              http::request<http::string_body> &req, std::chrono::seconds timeout)
    {
        boost::asio::ip::tcp::resolver resolver{ioc};
        auto const results = resolver.resolve(u.host, u.port);
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, ssl_ctx_};

        if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str()))
            throw boost::system::system_error(
                boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()));
        if (tls_.mode != TlsPolicy::Mode::skip)
            stream.set_verify_callback(boost::asio::ssl::host_name_verification(u.host));

        auto &lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        run_step(ioc, [&](auto h) { lowest.async_connect(results, h); });
        lowest.expires_after(timeout);
        run_step(ioc, [&](auto h) { stream.async_handshake(boost::asio::ssl::stream_base::client, h); });

        auto out = roundtrip(ioc, stream, lowest, req, timeout);

        // brokers routinely drop the connection without close_notify
        boost::system::error_code ignored;
        lowest.expires_after(timeout);
        stream.async_shutdown([&ignored](boost::system::error_code e) { ignored = e; });
        ioc.restart();
        ioc.run();
        return out;
    }
};
