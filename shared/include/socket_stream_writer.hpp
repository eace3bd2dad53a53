#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <stdexcept>

#include "stream_writer.hpp"

#pragma once

class SocketStreamWriter : public StreamWriter {
	public:
		explicit SocketStreamWriter(int sock)
			: fd(sock) {}
		
		void write(const uint8_t* data, size_t len) override {
			size_t total = 0;
			while (total < len) {
				// MSG_NOSIGNAL: a vanished peer must surface as an error, not SIGPIPE
				ssize_t sent = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
				if (sent < 0 && errno == EINTR) continue;
				if (sent <= 0) {
					throw std::runtime_error(std::string("Socket write failed: ") + std::strerror(errno));
				}

				total += sent;
			}
		}

		void write(const std::string& text) {
			write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
		}

		void flush() override {}

	private:
		int fd;
};
