/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/net/tls_options.hpp>

namespace mailsync::net
{

using mailsync::asio::any_io_executor;
using mailsync::asio::awaitable;
using mailsync::asio::tcp;
namespace ssl = mailsync::asio::ssl;

/**
A plain TCP socket that can turn into a TLS stream in place.

The connection code holds one `upgradable_stream` for its whole life, so the
implicit TLS and STARTTLS paths share the same dialog type.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = tcp::socket::lowest_layer_type;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /// Handshake as a client; `sni` doubles as the name checked against the certificate
    awaitable<result_void> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        MAILSYNC_CO_TRY_VOID(configure_context(context, opt));

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);
        auto& tls_stream = std::get<ssl_stream>(stream_);

        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                if (sni.empty())
                    co_return fail(errc::tls_verify_failed, "TLS host name verification requires a host name");
                tls_stream.set_verify_callback(ssl::host_name_verification(sni));
            }
        }
        else
        {
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        auto [ec] = co_await tls_stream.async_handshake(ssl::stream_base::client, mailsync::asio::use_nothrow_awaitable);
        if (ec)
            co_return fail(errc::tls_handshake_failed, "TLS handshake failed", ec.message(), ec);

        co_return enforce_pins(tls_stream, opt);
    }

private:
    static std::string digest_hex(const unsigned char* digest, std::size_t size)
    {
        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(size * 2);
        for (std::size_t i = 0; i < size; ++i)
        {
            out.push_back(hex[digest[i] >> 4]);
            out.push_back(hex[digest[i] & 0x0F]);
        }
        return out;
    }

    static std::string digest_base64(const unsigned char* digest, std::size_t size)
    {
        std::string out(4 * ((size + 2) / 3), '\0');
        const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), digest, static_cast<int>(size));
        out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
        return out;
    }

    /// SHA-256 of a DER encoding, checked against every pin in both hex and base64 form
    static bool der_matches(const std::vector<unsigned char>& der, const std::vector<std::string>& pins)
    {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256(der.data(), der.size(), digest);
        const std::string hex = digest_hex(digest, SHA256_DIGEST_LENGTH);
        const std::string b64 = digest_base64(digest, SHA256_DIGEST_LENGTH);

        bool matched = false;
        for (const auto& pin : pins)
        {
            const std::string normalized = normalize_fingerprint(pin);
            matched |= constant_time_equals(normalized, hex);
            matched |= constant_time_equals(normalized, b64);
        }
        return matched;
    }

    template<typename I2D, typename Object>
    static std::vector<unsigned char> to_der(I2D i2d, Object* object)
    {
        const int len = i2d(object, nullptr);
        if (len <= 0)
            return {};
        std::vector<unsigned char> der(static_cast<std::size_t>(len));
        unsigned char* ptr = der.data();
        i2d(object, &ptr);
        return der;
    }

    static result_void enforce_pins(ssl_stream& tls_stream, const tls_options& opt)
    {
        if (opt.pinned_cert_sha256.empty() && opt.pinned_spki_sha256.empty())
            return ok();

        std::unique_ptr<X509, decltype(&X509_free)> cert(
            SSL_get_peer_certificate(tls_stream.native_handle()), X509_free);
        if (!cert)
            return fail(errc::tls_pinning_failed, "TLS pinning failure: no peer certificate");

        bool matched = false;
        if (!opt.pinned_cert_sha256.empty())
            matched |= der_matches(to_der(i2d_X509, cert.get()), opt.pinned_cert_sha256);
        if (!opt.pinned_spki_sha256.empty())
            matched |= der_matches(to_der(i2d_X509_PUBKEY, X509_get_X509_PUBKEY(cert.get())), opt.pinned_spki_sha256);

        if (!matched)
            return fail(errc::tls_pinning_failed, "TLS pinning failure: certificate mismatch");
        return ok();
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace mailsync::net
