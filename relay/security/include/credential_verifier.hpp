#include <string>

#include "crypto.hpp"

#pragma once

/*
*	Static username/password gate. The password is hashed once at startup and
*	only the hash is kept; every connection presents HTTP Basic credentials and
*	is checked on its own.
*/
class CredentialVerifier
{
	public:
		enum class Verdict {
			OK,
			UNAUTHORIZED,
			INTERNAL
		};

		struct Result {
			Verdict verdict;
			std::string reason;
		};

		struct BasicCredentials {
			std::string username;
			std::string password;
		};

		// wipes `password` once hashed
		CredentialVerifier(const std::string& username, std::string& password);

		static CredentialVerifier from_hash(const std::string& username, const std::string& password_hash);

		Result verify(const std::string& authorization_header) const;

		// "Basic <base64(user:pass)>", false if absent or malformed
		static bool parse_basic(const std::string& authorization_header, BasicCredentials& out);

		const std::string& username() const { return expected_username; }

	private:
		CredentialVerifier() = default;

		std::string expected_username;
		std::string password_hash;
};
