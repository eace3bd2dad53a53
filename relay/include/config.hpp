#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "logger.hpp"

#pragma once

enum class AuthMode {
	NONE,
	BASIC,
	TOKEN
};

enum class PairingMode {
	UPLOAD_FIRST,
	EITHER_ORDER
};

AuthMode parse_auth_mode(const std::string& name);
PairingMode parse_pairing_mode(const std::string& name);
const char* auth_mode_to_string(AuthMode mode);
const char* pairing_mode_to_string(PairingMode mode);

struct ServerConfig
{
	inline static const uint16_t DEFAULT_PORT = 3000;
	inline static const uint16_t DEFAULT_BASIC_PORT = 4000;

	uint16_t port = DEFAULT_PORT;
	bool port_explicit = false;
	std::string bind_address = "0.0.0.0";

	AuthMode auth_mode = AuthMode::NONE;
	PairingMode pairing = PairingMode::UPLOAD_FIRST;

	// basic mode only, never persisted
	std::string username;
	std::string password;

	std::chrono::milliseconds pair_timeout{std::chrono::seconds(300)};
	size_t channel_capacity = 16;

	std::chrono::seconds token_lifetime{20 * 60};
	std::chrono::seconds token_extension{5 * 60};
	std::chrono::milliseconds token_sweep_interval{std::chrono::seconds(60)};

	// request heads must arrive within this window
	std::chrono::seconds head_timeout{30};

	std::filesystem::path log_path;
	size_t log_max_bytes = 10 * 1024 * 1024;

	// throws std::invalid_argument on an unusable combination
	void validate() const;

	Logger::LoggerConfig logger_config() const;

	// BEAM_CONFIG file, then BEAM_* environment, then `beam <username> <password>`
	static ServerConfig from_args(int argc, char** argv);

	void apply_json_file(const std::filesystem::path& path);
	void apply_json(const std::string& text);
	void apply_env();
};
