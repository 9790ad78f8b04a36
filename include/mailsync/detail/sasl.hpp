/*

sasl.hpp
--------

SASL helpers for mailsync: PLAIN, token and XOAUTH2 blobs.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <openssl/evp.h>

#include <mailsync/detail/result.hpp>

namespace mailsync::detail
{

/// Single line base64 (no wrapping), as SASL requires
[[nodiscard]] inline std::string base64_encode(std::string_view input)
{
    if (input.empty())
        return {};
    std::string out(4 * ((input.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

[[nodiscard]] inline result<std::string> base64_decode(std::string_view input)
{
    if (input.empty())
        return ok(std::string{});
    if (input.size() % 4 != 0)
        return fail<std::string>(errc::codec_invalid_input, "base64 input length is not a multiple of 4");

    std::string out(3 * input.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
    if (written < 0)
        return fail<std::string>(errc::codec_invalid_input, "invalid base64 input");

    // EVP_DecodeBlock counts padding bytes as zeros
    std::size_t size = static_cast<std::size_t>(written);
    if (input.back() == '=')
        --size;
    if (input.size() >= 2 && input[input.size() - 2] == '=')
        --size;
    out.resize(size);
    return ok(std::move(out));
}

} // namespace mailsync::detail

namespace mailsync::sasl
{

/// \0username\0password
[[nodiscard]] inline std::string encode_plain(std::string_view username, std::string_view password)
{
    std::string plain;
    plain.reserve(2 + username.size() + password.size());
    plain.push_back('\0');
    plain += username;
    plain.push_back('\0');
    plain += password;
    return ::mailsync::detail::base64_encode(plain);
}

/// base64(NUL identity NUL token), the blob sent for token credentials
[[nodiscard]] inline std::string encode_token(std::string_view identity, std::string_view token)
{
    return encode_plain(identity, token);
}

/// user=<email>^Aauth=Bearer <token>^A^A
[[nodiscard]] inline std::string encode_xoauth2(std::string_view username, std::string_view access_token)
{
    std::string xoauth2;
    xoauth2.reserve(5 + username.size() + 13 + access_token.size() + 2);
    xoauth2 += "user=";
    xoauth2 += username;
    xoauth2 += '\x01';
    xoauth2 += "auth=Bearer ";
    xoauth2 += access_token;
    xoauth2 += "\x01\x01";
    return ::mailsync::detail::base64_encode(xoauth2);
}

} // namespace mailsync::sasl
