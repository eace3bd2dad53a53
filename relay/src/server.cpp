#include "server.hpp"

#include "crypto.hpp"

#include <sys/socket.h>   // socket(), bind(), listen(), accept()
#include <netinet/in.h>   // sockaddr_in, htons()
#include <arpa/inet.h>    // inet_pton(), inet_ntop()
#include <unistd.h>       // close()

#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <system_error>
#include <thread>

Server::Server(const ServerConfig& cfg, std::shared_ptr<Logger> log)
	: config(cfg),
	  logger(std::move(log)),
	  relay(std::make_shared<RelayService>(cfg, logger))
{
	// password lives on only as a hash inside the service
	Crypto::wipe(config.password);
}

Server::~Server()
{
	stop();

	if (sockfd >= 0) {
		close(sockfd);
		sockfd = -1;
	}
}

void Server::bind_and_listen()
{
	// create a socket
	sockfd = socket(AF_INET, SOCK_STREAM, 0);
	if (sockfd < 0) {
		throw std::system_error(errno, std::generic_category(), "Failed to create socket");
	}

	sockaddr_in addr{};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(config.port);
	if (inet_pton(AF_INET, config.bind_address.c_str(), &addr.sin_addr) != 1) {
		throw std::system_error(EINVAL, std::generic_category(), "Invalid bind address " + config.bind_address);
	}

	int opt = 1;
	setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
	signal(SIGPIPE, SIG_IGN);

	if (bind(sockfd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
		throw std::system_error(errno, std::generic_category(), "Failed to bind port " + std::to_string(config.port));
	}

	if (listen(sockfd, LISTEN_BACKLOG) < 0) {
		throw std::system_error(errno, std::generic_category(), "Listening failed");
	}

	sockaddr_in bound{};
	socklen_t bound_size = sizeof(bound);
	if (getsockname(sockfd, (struct sockaddr*)&bound, &bound_size) == 0) {
		bound_port = ntohs(bound.sin_port);
	}
	else {
		bound_port = config.port;
	}

	logger->log_event(Logger::LogEvent::SERVICE_START, {
		{"address", config.bind_address},
		{"port", static_cast<int>(bound_port)},
		{"auth", auth_mode_to_string(config.auth_mode)},
		{"pairing", pairing_mode_to_string(config.pairing)}
	});
}

void Server::run()
{
	if (sockfd < 0) {
		bind_and_listen();
	}

	// wait for connections
	while (!quit) {
		sockaddr_in client_addr{};
		socklen_t client_size = sizeof(client_addr);
		int clientfd = accept(sockfd, (struct sockaddr*)&client_addr, &client_size);
		if (clientfd < 0) {
			if (quit) break;
			if (errno == EINTR || errno == ECONNABORTED) continue;
			if (errno == EMFILE || errno == ENFILE) {
				// out of descriptors, back off instead of spinning
				std::this_thread::sleep_for(std::chrono::milliseconds(100));
				continue;
			}
			if (errno == EINVAL || errno == EBADF) break;

			logger->log_event(Logger::LogEvent::INTERNAL_ERROR, {
				{"error", "accept failed"},
				{"errno", static_cast<int>(errno)}
			});
			continue;
		}

		char ip[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

		logger->log_event(Logger::LogEvent::CLIENT_CONNECT, {
			{"ip", ip},
			{"port", static_cast<int>(ntohs(client_addr.sin_port))},
			{"fd", clientfd}
		});

		std::shared_ptr<RelayService> handler = relay;
		try {
			std::thread t([handler, clientfd] {
				handler->handle_client(clientfd);
			});
			t.detach();
		}
		catch (const std::system_error& e) {
			logger->log_event(Logger::LogEvent::INTERNAL_ERROR, {
				{"error", e.what()},
				{"fd", clientfd}
			});
			close(clientfd);
		}
	}

	logger->log_event(Logger::LogEvent::SERVICE_STOP, {
		{"port", static_cast<int>(bound_port)}
	});
}

void Server::stop()
{
	if (quit.exchange(true)) return;

	// wakes the blocked accept()
	if (sockfd >= 0) {
		shutdown(sockfd, SHUT_RDWR);
	}
}
