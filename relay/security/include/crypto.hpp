#include <cstddef>
#include <cstdint>
#include <string>

#include <sodium.h>

#pragma once

class Crypto
{
    public:
        enum class PasswordCheck {
            MATCH,
            MISMATCH,
            MALFORMED_HASH
        };

        // sodium_init() once per process, throws if libsodium is unusable
        static void init();

        // Argon2id hash string with an embedded random salt
        static std::string hash_password(const std::string& password);
        static PasswordCheck verify_password(const std::string& stored_hash, const std::string& password);

        // hex encoded, from randombytes_buf()
        static std::string random_token(size_t num_bytes = 32);

        // standard alphabet with padding, false on malformed input
        static bool base64_decode(const std::string& encoded, std::string& out);
        static std::string base64_encode(const std::string& raw);

        // constant time, lengths are not secret
        static bool equal(const std::string& a, const std::string& b);

        // wipes the string's buffer before it is released
        static void wipe(std::string& secret);
};
