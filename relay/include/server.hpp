#include <atomic>
#include <cstdint>
#include <memory>

#include "config.hpp"
#include "logger.hpp"
#include "relay_service.hpp"

#pragma once

class Server 
{
	public:
		Server(const ServerConfig& config, std::shared_ptr<Logger> logger);
		~Server();

		Server(const Server&) = delete;
		Server& operator=(const Server&) = delete;

		// throws std::system_error if the port cannot be bound
		void bind_and_listen();

		// accept loop, returns after stop()
		void run();
		void stop();

		// the bound port, useful when the configured port was 0
		uint16_t port() const { return bound_port; }

		std::shared_ptr<RelayService> service() const { return relay; }

	private:
		const int LISTEN_BACKLOG = 64;

		ServerConfig config;
		std::shared_ptr<Logger> logger;
		std::shared_ptr<RelayService> relay;

		int sockfd = -1;
		uint16_t bound_port = 0;
		std::atomic<bool> quit{false};
};
