#include "client.hpp"

#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <sodium.h>

#include "socket_stream_writer.hpp"

namespace {

struct SocketGuard {
	int fd;
	~SocketGuard() { if (fd >= 0) close(fd); }
};

std::string base64_encode(const std::string& in)
{
	std::string out(sodium_base64_ENCODED_LEN(in.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
	sodium_bin2base64(&out[0], out.size(),
		reinterpret_cast<const unsigned char*>(in.data()), in.size(),
		sodium_base64_VARIANT_ORIGINAL);
	out.resize(std::strlen(out.c_str()));
	return out;
}

}

size_t StringSource::read(uint8_t* buf, size_t cap)
{
	size_t n = std::min(cap, data.size() - offset);
	std::memcpy(buf, data.data() + offset, n);
	offset += n;
	return n;
}

FileSource::FileSource(const std::filesystem::path& path)
	: in_file(path, std::ios::binary)
{
	if (!in_file.is_open()) {
		throw std::runtime_error("Failed to open file: " + path.string());
	}
	file_size = std::filesystem::file_size(path);
}

size_t FileSource::read(uint8_t* buf, size_t cap)
{
	in_file.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(cap));
	if (in_file.bad()) {
		throw StreamReadError("Failed to read local file");
	}
	return static_cast<size_t>(in_file.gcount());
}

Client::Client(Endpoint endpoint, Credentials credentials)
	: endpoint(std::move(endpoint)), credentials(std::move(credentials))
{
	if (sodium_init() < 0) {
		throw std::runtime_error("libsodium initialization failed");
	}
}

int Client::connect_socket() const
{
	addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	addrinfo* result = nullptr;
	int rc = getaddrinfo(endpoint.host.c_str(), std::to_string(endpoint.port).c_str(), &hints, &result);
	if (rc != 0) {
		throw std::runtime_error("Failed to resolve " + endpoint.host + ": " + gai_strerror(rc));
	}

	int sock = -1;
	for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
		sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (sock < 0) continue;

		if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) break;

		close(sock);
		sock = -1;
	}
	freeaddrinfo(result);

	if (sock < 0) {
		throw std::runtime_error("Connection failed to " + endpoint.host + ":" + std::to_string(endpoint.port));
	}

	return sock;
}

std::vector<std::pair<std::string, std::string>> Client::base_headers() const
{
	std::vector<std::pair<std::string, std::string>> headers = {
		{"Host", endpoint.host + ":" + std::to_string(endpoint.port)},
		{"Connection", "close"}
	};

	if (!credentials.token.empty()) {
		headers.emplace_back("Authorization", "Bearer " + credentials.token);
	}
	else if (!credentials.username.empty()) {
		headers.emplace_back("Authorization",
			"Basic " + base64_encode(credentials.username + ":" + credentials.password));
	}

	return headers;
}

void Client::send_header(const std::string& header, int sock)
{
	SocketStreamWriter(sock).write(header);
}

void Client::send_binary(ByteSource& source, int sock, bool chunked)
{
	SocketStreamWriter writer(sock);
	ChunkedStreamWriter chunked_writer(writer);
	StreamWriter& out = chunked ? static_cast<StreamWriter&>(chunked_writer) : writer;

	uint8_t buf[16 * 1024];
	size_t n;
	while ((n = source.read(buf, sizeof(buf))) > 0) {
		out.write(buf, n);
	}

	if (chunked) {
		chunked_writer.finish();
	}
}

Client::Response Client::read_response(SocketReader& reader, StreamWriter* sink)
{
	HttpResponseHead head = parse_response(reader.read_head());

	Response response;
	response.status = head.status;
	response.reason = head.reason;
	response.headers = head.headers;

	HttpBodyReader body = HttpBodyReader::for_response(reader, head);

	StringSink captured;
	StreamWriter& out = (sink && head.status == 200) ? *sink : static_cast<StreamWriter&>(captured);

	uint8_t buf[16 * 1024];
	size_t n;
	while ((n = body.read(buf, sizeof(buf))) > 0) {
		out.write(buf, n);
	}
	out.flush();

	response.body = captured.str();
	return response;
}

Client::Response Client::upload(const std::string& file_id, ByteSource& source, std::optional<uint64_t> length)
{
	SocketGuard guard{connect_socket()};

	auto headers = base_headers();
	headers.emplace_back("Content-Type", "application/octet-stream");
	if (length) {
		headers.emplace_back("Content-Length", std::to_string(*length));
	}
	else {
		headers.emplace_back("Transfer-Encoding", "chunked");
	}

	SocketReader reader(guard.fd);

	try {
		send_header(format_request_head("PUT", "/" + url_encode(file_id), headers), guard.fd);
		send_binary(source, guard.fd, !length);
	}
	catch (const StreamReadError&) {
		throw;
	}
	catch (const std::runtime_error&) {
		// the server may have answered (409, 401) without reading the body
		return read_response(reader, nullptr);
	}

	return read_response(reader, nullptr);
}

Client::Response Client::upload(const std::string& file_id, const std::string& data)
{
	StringSource source(data);
	return upload(file_id, source, static_cast<uint64_t>(data.size()));
}

Client::Response Client::download(const std::string& file_id, StreamWriter& sink)
{
	SocketGuard guard{connect_socket()};

	send_header(format_request_head("GET", "/" + url_encode(file_id), base_headers()), guard.fd);

	SocketReader reader(guard.fd);
	return read_response(reader, &sink);
}

Client::Response Client::get(const std::string& target)
{
	SocketGuard guard{connect_socket()};

	send_header(format_request_head("GET", target, base_headers()), guard.fd);

	SocketReader reader(guard.fd);
	return read_response(reader, nullptr);
}

std::string Client::issue_token()
{
	SocketGuard guard{connect_socket()};

	auto headers = base_headers();
	headers.emplace_back("Content-Length", "0");
	send_header(format_request_head("POST", "/token", headers), guard.fd);

	SocketReader reader(guard.fd);
	Response response = read_response(reader, nullptr);
	if (response.status != 200) {
		throw std::runtime_error("Token request failed with status " + std::to_string(response.status));
	}

	try {
		return nlohmann::json::parse(response.body).at("token").get<std::string>();
	}
	catch (const nlohmann::json::exception& e) {
		throw std::runtime_error(std::string("Malformed token response: ") + e.what());
	}
}
