#include "crypto.hpp"

#include <openssl/crypto.h>

#include <stdexcept>
#include <vector>

void Crypto::init()
{
    if (sodium_init() < 0) {
        throw std::runtime_error("Sodium error: sodium_init failed");
    }
}

std::string Crypto::hash_password(const std::string& password)
{
    char out[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(
            out,
            password.data(),
            password.size(),
            crypto_pwhash_OPSLIMIT_INTERACTIVE,
            crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
        throw std::runtime_error("Sodium error: password hashing ran out of memory");
    }

    return std::string(out);
}

Crypto::PasswordCheck Crypto::verify_password(const std::string& stored_hash, const std::string& password)
{
    // crypto_pwhash_str_verify() reports a garbled hash and a wrong password the
    // same way, so parse the stored string first
    if (stored_hash.empty() || stored_hash.size() >= crypto_pwhash_STRBYTES) {
        return PasswordCheck::MALFORMED_HASH;
    }

    if (crypto_pwhash_str_needs_rehash(
            stored_hash.c_str(),
            crypto_pwhash_OPSLIMIT_INTERACTIVE,
            crypto_pwhash_MEMLIMIT_INTERACTIVE) == -1) {
        return PasswordCheck::MALFORMED_HASH;
    }

    if (crypto_pwhash_str_verify(stored_hash.c_str(), password.data(), password.size()) != 0) {
        return PasswordCheck::MISMATCH;
    }

    return PasswordCheck::MATCH;
}

std::string Crypto::random_token(size_t num_bytes)
{
    std::vector<uint8_t> raw(num_bytes);
    randombytes_buf(raw.data(), raw.size());

    std::vector<char> hex(num_bytes * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());

    sodium_memzero(raw.data(), raw.size());
    return std::string(hex.data(), num_bytes * 2);
}

bool Crypto::base64_decode(const std::string& encoded, std::string& out)
{
    std::vector<unsigned char> bin(encoded.size() + 1);
    size_t bin_len = 0;

    if (sodium_base642bin(
            bin.data(),
            bin.size(),
            encoded.data(),
            encoded.size(),
            nullptr,
            &bin_len,
            nullptr,
            sodium_base64_VARIANT_ORIGINAL) != 0) {
        return false;
    }

    out.assign(reinterpret_cast<const char*>(bin.data()), bin_len);
    sodium_memzero(bin.data(), bin.size());
    return true;
}

std::string Crypto::base64_encode(const std::string& raw)
{
    std::vector<char> b64(sodium_base64_ENCODED_LEN(raw.size(), sodium_base64_VARIANT_ORIGINAL));

    sodium_bin2base64(
        b64.data(),
        b64.size(),
        reinterpret_cast<const unsigned char*>(raw.data()),
        raw.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(b64.data());
}

bool Crypto::equal(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void Crypto::wipe(std::string& secret)
{
    if (!secret.empty()) {
        sodium_memzero(&secret[0], secret.size());
    }
    secret.clear();
}
