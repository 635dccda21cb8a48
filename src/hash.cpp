// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "hash.hpp"

#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace git_migrator {

static std::string digest(EVP_MD const* md, std::string const& data)
{
    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> ctx(
        EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), out, &len) != 1)
    {
        throw std::runtime_error("message digest computation failed");
    }
    return std::string(reinterpret_cast<char const*>(out), len);
}

std::string sha1(std::string const& data)
{
    return digest(EVP_sha1(), data);
}

std::string sha256(std::string const& data)
{
    return digest(EVP_sha256(), data);
}

std::string to_hex(std::string const& raw, std::size_t max_bytes)
{
    static char const digits[] = "0123456789abcdef";
    std::size_t n = std::min(raw.size(), max_bytes);
    std::string result;
    result.reserve(2 * n);
    for (std::size_t i = 0; i < n; ++i)
    {
        unsigned char b = static_cast<unsigned char>(raw[i]);
        result += digits[b >> 4];
        result += digits[b & 0xF];
    }
    return result;
}

} // namespace git_migrator
