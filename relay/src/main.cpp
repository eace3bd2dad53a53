#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "config.hpp"
#include "crypto.hpp"
#include "logger.hpp"
#include "server.hpp"

namespace {

Server* running_server = nullptr;

void handle_stop_signal(int)
{
	if (running_server) {
		running_server->stop();
	}
}

}

int main(int argc, char** argv)
{
	ServerConfig config;
	try {
		config = ServerConfig::from_args(argc, argv);
	}
	catch (const std::invalid_argument& e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}

	auto logger = std::make_shared<Logger>(config.logger_config());

	try {
		Server server(config, logger);
		Crypto::wipe(config.password);

		server.bind_and_listen();

		std::cout << "Listening on " << config.bind_address << ":" << server.port() << std::endl;

		running_server = &server;
		std::signal(SIGINT, handle_stop_signal);
		std::signal(SIGTERM, handle_stop_signal);

		server.run();
		running_server = nullptr;
	}
	catch (const std::system_error& e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}
	catch (const std::exception& e) {
		std::cerr << "Failed to start: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
