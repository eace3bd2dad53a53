#include <cstddef>
#include <cstdint>
#include <fstream>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "byte_source.hpp"
#include "http_wire.hpp"
#include "stream_writer.hpp"

#pragma once

class StringSource : public ByteSource
{
	public:
		explicit StringSource(std::string data)
			: data(std::move(data)) {}

		size_t read(uint8_t* buf, size_t cap) override;

	private:
		std::string data;
		size_t offset = 0;
};

class FileSource : public ByteSource
{
	public:
		explicit FileSource(const std::filesystem::path& path);

		size_t read(uint8_t* buf, size_t cap) override;
		uint64_t size() const { return file_size; }

	private:
		std::ifstream in_file;
		uint64_t file_size;
};

class StringSink : public StreamWriter
{
	public:
		void write(const uint8_t* data, size_t len) override {
			bytes.append(reinterpret_cast<const char*>(data), len);
		}
		void flush() override {}

		const std::string& str() const { return bytes; }

	private:
		std::string bytes;
};

class Client
{
	public:	
		struct Endpoint {
			std::string host = "127.0.0.1";
			uint16_t port = 3000;
		};

		// username/password for basic mode, token for token mode
		struct Credentials {
			std::string username;
			std::string password;
			std::string token;
		};

		struct Response {
			int status = 0;
			std::string reason;
			HttpHeaders headers;

			// error bodies, and success bodies that were not streamed to a sink
			std::string body;
		};

		explicit Client(Endpoint endpoint, Credentials credentials = Credentials());

		// Content-Length when the size is known, chunked otherwise. Blocks until
		// the server reports the outcome of the whole relay.
		Response upload(const std::string& file_id, ByteSource& source, std::optional<uint64_t> length = std::nullopt);
		Response upload(const std::string& file_id, const std::string& data);

		// a 200 body goes to sink; throws StreamReadError if the relay broke mid-stream
		Response download(const std::string& file_id, StreamWriter& sink);

		Response get(const std::string& target);

		// throws std::runtime_error unless the server hands out a token
		std::string issue_token();

		void set_token(const std::string& token) { credentials.token = token; }

	private:
		Endpoint endpoint;
		Credentials credentials;

		int connect_socket() const;
		std::vector<std::pair<std::string, std::string>> base_headers() const;

		static void send_header(const std::string& header, int sock);
		static void send_binary(ByteSource& source, int sock, bool chunked);
		static Response read_response(SocketReader& reader, StreamWriter* sink);
};
