#include "credential_verifier.hpp"

#include <cctype>
#include <stdexcept>

CredentialVerifier::CredentialVerifier(const std::string& username, std::string& password)
	: expected_username(username)
{
	if (username.empty()) {
		throw std::invalid_argument("Username must not be empty");
	}

	if (password.empty()) {
		throw std::invalid_argument("Password must not be empty");
	}

	Crypto::init();
	password_hash = Crypto::hash_password(password);
	Crypto::wipe(password);
}

CredentialVerifier CredentialVerifier::from_hash(const std::string& username, const std::string& hash)
{
	Crypto::init();

	CredentialVerifier verifier;
	verifier.expected_username = username;
	verifier.password_hash = hash;
	return verifier;
}

bool CredentialVerifier::parse_basic(const std::string& header, BasicCredentials& out)
{
	size_t sp = header.find(' ');
	if (sp == std::string::npos) return false;

	std::string scheme = header.substr(0, sp);
	for (char& c : scheme) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	if (scheme != "basic") return false;

	size_t start = header.find_first_not_of(' ', sp);
	if (start == std::string::npos) return false;

	std::string encoded = header.substr(start);
	while (!encoded.empty() && encoded.back() == ' ') {
		encoded.pop_back();
	}

	std::string decoded;
	if (!Crypto::base64_decode(encoded, decoded)) return false;

	size_t colon = decoded.find(':');
	if (colon == std::string::npos) {
		Crypto::wipe(decoded);
		return false;
	}

	out.username = decoded.substr(0, colon);
	out.password = decoded.substr(colon + 1);
	Crypto::wipe(decoded);
	return true;
}

CredentialVerifier::Result CredentialVerifier::verify(const std::string& authorization_header) const
{
	if (authorization_header.empty()) {
		return {Verdict::UNAUTHORIZED, "Missing Authorization header"};
	}

	BasicCredentials presented;
	if (!parse_basic(authorization_header, presented)) {
		return {Verdict::UNAUTHORIZED, "Failed to parse Authorization header"};
	}

	if (!Crypto::equal(presented.username, expected_username)) {
		Crypto::wipe(presented.password);
		return {Verdict::UNAUTHORIZED, "Unknown username supplied"};
	}

	if (presented.password.empty()) {
		return {Verdict::UNAUTHORIZED, "Basic auth password is empty"};
	}

	Crypto::PasswordCheck check = Crypto::verify_password(password_hash, presented.password);
	Crypto::wipe(presented.password);

	switch (check) {
		case Crypto::PasswordCheck::MATCH:
			return {Verdict::OK, ""};
		case Crypto::PasswordCheck::MISMATCH:
			return {Verdict::UNAUTHORIZED, "Wrong password"};
		case Crypto::PasswordCheck::MALFORMED_HASH:
			return {Verdict::INTERNAL, "Stored password hash is invalid"};
	}

	return {Verdict::INTERNAL, "Unreachable password check result"};
}
