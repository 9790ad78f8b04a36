/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/ssl.h>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
    std::vector<std::string> pinned_spki_sha256;
    std::vector<std::string> pinned_cert_sha256;

    /// Account level "validate certificates" switch
    [[nodiscard]] static tls_options from_validation(bool validate)
    {
        tls_options opt;
        if (!validate)
        {
            opt.verify = verify_mode::none;
            opt.verify_host = false;
        }
        return opt;
    }
};

/**
Bring a pin to a comparable form.

Hex pins lose separators and are lower-cased; anything else is treated as
base64 and padded to a multiple of four.
**/
[[nodiscard]] inline std::string normalize_fingerprint(std::string_view input)
{
    std::string compact;
    compact.reserve(input.size());
    for (char ch : input)
    {
        if (!std::isspace(static_cast<unsigned char>(ch)))
            compact.push_back(ch);
    }

    std::string hex;
    hex.reserve(compact.size());
    bool is_hex = !compact.empty();
    for (char ch : compact)
    {
        if (ch == ':' || ch == '-')
            continue;
        if (!std::isxdigit(static_cast<unsigned char>(ch)))
        {
            is_hex = false;
            break;
        }
        hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (is_hex && !hex.empty())
        return hex;

    const std::size_t mod = compact.size() % 4;
    if (mod != 0)
        compact.append(4 - mod, '=');
    return compact;
}

[[nodiscard]] inline bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    std::size_t diff = a.size() ^ b.size();
    const std::size_t max_len = std::max(a.size(), b.size());
    for (std::size_t i = 0; i < max_len; ++i)
    {
        const auto ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0u;
        const auto cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0u;
        diff |= static_cast<std::size_t>(ca ^ cb);
    }
    return diff == 0;
}

/// Load trust anchors and the minimum protocol version into an SSL context
inline result_void configure_context(mailsync::asio::ssl::context& ctx, const tls_options& options)
{
    mailsync::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail(errc::tls_verify_failed, "TLS trust store configuration failed", ec.message(), ec);
    }
    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail(errc::tls_verify_failed, "TLS CA file could not be loaded", file, ec);
    }
    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail(errc::tls_verify_failed, "TLS CA path could not be added", path, ec);
    }

    if (options.min_tls_version.has_value() &&
        SSL_CTX_get_min_proto_version(ctx.native_handle()) == 0 &&
        SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
    {
        return fail(errc::tls_handshake_failed, "TLS minimum version could not be applied");
    }
    return ok();
}

} // namespace mailsync::net
