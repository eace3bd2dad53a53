#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "byte_source.hpp"
#include "stream_writer.hpp"
#include "socket_stream_writer.hpp"

#pragma once

/*
*	Minimal HTTP/1.1 framing shared by the relay server and the client.
*	One request per connection, so there is no keep-alive bookkeeping here.
*/

class HttpParseError : public std::runtime_error
{
	public:
		explicit HttpParseError(const std::string& what)
			: std::runtime_error(what) {}
};

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest
{
	std::string method;
	std::string target;
	std::string path;
	std::string query;
	std::string version;
	HttpHeaders headers;

	// header names are stored lower-case
	std::string header(const std::string& name) const;
	bool has_header(const std::string& name) const;
	std::string query_param(const std::string& key) const;
};

struct HttpResponseHead
{
	std::string version;
	int status = 0;
	std::string reason;
	HttpHeaders headers;

	std::string header(const std::string& name) const;
};

class SocketReader
{
	public:
		constexpr static size_t MAX_HEAD_BYTES = 16 * 1024;
		constexpr static size_t MAX_LINE_BYTES = 1024;

		explicit SocketReader(int sock)
			: fd(sock) {}

		// everything up to and including the blank line
		std::string read_head(size_t limit = MAX_HEAD_BYTES);
		std::string read_line(size_t limit = MAX_LINE_BYTES);

		// buffered bytes first, then the socket; 0 at EOF
		size_t read_some(uint8_t* buf, size_t cap);
		void read_exact(uint8_t* buf, size_t n);

		int socket() const { return fd; }

	private:
		int fd;
		std::string rx_buffer;

		// appends one recv() worth of bytes, false at EOF
		bool fill();
};

class HttpBodyReader : public ByteSource
{
	public:
		enum class Framing {
			NONE,
			LENGTH,
			CHUNKED,
			UNTIL_CLOSE
		};

		HttpBodyReader(SocketReader& reader, Framing framing, uint64_t length = 0)
			: reader(reader), framing(framing), remaining(length) {}

		static HttpBodyReader for_request(SocketReader& reader, const HttpRequest& request);
		static HttpBodyReader for_response(SocketReader& reader, const HttpResponseHead& head);

		size_t read(uint8_t* buf, size_t cap) override;

		// runs once, right before the first byte is pulled (100-continue)
		void on_first_read(std::function<void()> hook) { first_read_hook = std::move(hook); }

	private:
		SocketReader& reader;
		Framing framing;
		uint64_t remaining;
		bool finished = false;
		bool chunk_started = false;
		std::function<void()> first_read_hook;

		size_t read_chunked(uint8_t* buf, size_t cap);
};

class ChunkedStreamWriter : public StreamWriter
{
	public:
		explicit ChunkedStreamWriter(StreamWriter& out)
			: out(out) {}

		void write(const uint8_t* data, size_t len) override;
		void flush() override { out.flush(); }

		// terminating zero-length chunk
		void finish();

	private:
		StreamWriter& out;
		bool finished = false;
};

HttpRequest parse_request(const std::string& head);
HttpResponseHead parse_response(const std::string& head);

std::string format_response_head(int status, const std::vector<std::pair<std::string, std::string>>& headers);
std::string format_request_head(const std::string& method, const std::string& target, const std::vector<std::pair<std::string, std::string>>& headers);

const char* reason_phrase(int status);

std::string url_decode(const std::string& encoded);
std::string url_encode(const std::string& raw);
