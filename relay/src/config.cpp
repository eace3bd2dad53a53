#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

uint16_t parse_port(const std::string& text)
{
	size_t used = 0;
	unsigned long value = 0;

	try {
		value = std::stoul(text, &used);
	}
	catch (const std::exception&) {
		throw std::invalid_argument("Invalid port: " + text);
	}

	if (used != text.size() || value > 65535) {
		throw std::invalid_argument("Invalid port: " + text);
	}

	return static_cast<uint16_t>(value);
}

template <typename T>
T positive(const json& value, const char* key)
{
	if (!value.is_number_unsigned() || value.get<T>() == 0) {
		throw std::invalid_argument(std::string("Config key ") + key + " must be a positive integer");
	}
	return value.get<T>();
}

}

AuthMode parse_auth_mode(const std::string& name)
{
	if (name == "none") return AuthMode::NONE;
	if (name == "basic") return AuthMode::BASIC;
	if (name == "token") return AuthMode::TOKEN;
	throw std::invalid_argument("Unknown auth mode: " + name + " (expected none, basic or token)");
}

PairingMode parse_pairing_mode(const std::string& name)
{
	if (name == "upload-first") return PairingMode::UPLOAD_FIRST;
	if (name == "either") return PairingMode::EITHER_ORDER;
	throw std::invalid_argument("Unknown pairing mode: " + name + " (expected upload-first or either)");
}

const char* auth_mode_to_string(AuthMode mode)
{
	switch (mode) {
		case AuthMode::NONE: return "none";
		case AuthMode::BASIC: return "basic";
		case AuthMode::TOKEN: return "token";
	}
	return "none";
}

const char* pairing_mode_to_string(PairingMode mode)
{
	switch (mode) {
		case PairingMode::UPLOAD_FIRST: return "upload-first";
		case PairingMode::EITHER_ORDER: return "either";
	}
	return "upload-first";
}

void ServerConfig::validate() const
{
	if (auth_mode == AuthMode::BASIC && (username.empty() || password.empty())) {
		throw std::invalid_argument("Basic auth needs a non-empty username and password");
	}

	if (channel_capacity == 0) {
		throw std::invalid_argument("channel_capacity must be at least 1");
	}

	if (pair_timeout.count() <= 0) {
		throw std::invalid_argument("pair timeout must be positive");
	}

	if (token_extension > token_lifetime) {
		throw std::invalid_argument("token extension must not exceed the token lifetime");
	}

	if (token_sweep_interval.count() <= 0) {
		throw std::invalid_argument("token sweep interval must be positive");
	}
}

Logger::LoggerConfig ServerConfig::logger_config() const
{
	Logger::LoggerConfig cfg;
	cfg.log_path = log_path;
	cfg.max_bytes = log_max_bytes;
	return cfg;
}

void ServerConfig::apply_json(const std::string& text)
{
	json cfg;
	try {
		cfg = json::parse(text);
	}
	catch (const json::parse_error& e) {
		throw std::invalid_argument(std::string("Config is not valid JSON: ") + e.what());
	}

	if (!cfg.is_object()) {
		throw std::invalid_argument("Config must be a JSON object");
	}

	try {
		if (cfg.contains("port")) {
			if (!cfg["port"].is_number_unsigned() || cfg["port"].get<uint64_t>() > 65535) {
				throw std::invalid_argument("Config key port must be 0-65535");
			}
			port = cfg["port"].get<uint16_t>();
			port_explicit = true;
		}
		if (cfg.contains("bind_address")) bind_address = cfg["bind_address"].get<std::string>();
		if (cfg.contains("auth")) auth_mode = parse_auth_mode(cfg["auth"].get<std::string>());
		if (cfg.contains("pairing")) pairing = parse_pairing_mode(cfg["pairing"].get<std::string>());
		if (cfg.contains("pair_timeout_secs")) {
			pair_timeout = std::chrono::seconds(positive<uint64_t>(cfg["pair_timeout_secs"], "pair_timeout_secs"));
		}
		if (cfg.contains("channel_capacity")) {
			channel_capacity = positive<size_t>(cfg["channel_capacity"], "channel_capacity");
		}
		if (cfg.contains("token_lifetime_secs")) {
			token_lifetime = std::chrono::seconds(positive<uint64_t>(cfg["token_lifetime_secs"], "token_lifetime_secs"));
		}
		if (cfg.contains("token_extension_secs")) {
			token_extension = std::chrono::seconds(positive<uint64_t>(cfg["token_extension_secs"], "token_extension_secs"));
		}
		if (cfg.contains("token_sweep_secs")) {
			token_sweep_interval = std::chrono::seconds(positive<uint64_t>(cfg["token_sweep_secs"], "token_sweep_secs"));
		}
		if (cfg.contains("log_path")) log_path = cfg["log_path"].get<std::string>();
		if (cfg.contains("log_max_bytes")) log_max_bytes = cfg["log_max_bytes"].get<size_t>();
	}
	catch (const json::type_error& e) {
		throw std::invalid_argument(std::string("Config value has the wrong type: ") + e.what());
	}
}

void ServerConfig::apply_json_file(const std::filesystem::path& path)
{
	std::ifstream in_file(path);
	if (!in_file.is_open()) {
		throw std::invalid_argument("Failed to open config file " + path.string());
	}

	std::stringstream buffer;
	buffer << in_file.rdbuf();
	apply_json(buffer.str());
}

void ServerConfig::apply_env()
{
	if (const char* value = std::getenv("BEAM_PORT")) {
		port = parse_port(value);
		port_explicit = true;
	}
	if (const char* value = std::getenv("BEAM_AUTH")) {
		auth_mode = parse_auth_mode(value);
	}
	if (const char* value = std::getenv("BEAM_PAIRING")) {
		pairing = parse_pairing_mode(value);
	}
	if (const char* value = std::getenv("BEAM_LOG")) {
		log_path = value;
	}
}

ServerConfig ServerConfig::from_args(int argc, char** argv)
{
	ServerConfig config;

	if (const char* path = std::getenv("BEAM_CONFIG")) {
		config.apply_json_file(path);
	}

	config.apply_env();

	if (argc == 3) {
		config.auth_mode = AuthMode::BASIC;
		config.username = argv[1];
		config.password = argv[2];
	}
	else if (argc != 1) {
		throw std::invalid_argument("Usage: beam [<username> <password>]");
	}

	if (config.auth_mode == AuthMode::BASIC && !config.port_explicit) {
		config.port = DEFAULT_BASIC_PORT;
	}

	config.validate();
	return config;
}
