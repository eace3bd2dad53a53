#include "http_wire.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace {

std::string to_lower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return s;
}

std::string trim(const std::string& s)
{
	size_t start = s.find_first_not_of(" \t");
	if (start == std::string::npos) return "";
	size_t end = s.find_last_not_of(" \t");
	return s.substr(start, end - start + 1);
}

// splits a head into its start line and header map
std::string split_head(const std::string& head, HttpHeaders& headers)
{
	std::vector<std::string> lines;
	size_t pos = 0;
	while (pos < head.size()) {
		size_t eol = head.find("\r\n", pos);
		if (eol == std::string::npos) eol = head.size();
		lines.push_back(head.substr(pos, eol - pos));
		pos = eol + 2;
	}

	while (!lines.empty() && lines.back().empty()) {
		lines.pop_back();
	}

	if (lines.empty()) {
		throw HttpParseError("Empty message head");
	}

	for (size_t i = 1; i < lines.size(); i++) {
		size_t colon = lines[i].find(':');
		if (colon == std::string::npos || colon == 0) {
			throw HttpParseError("Malformed header line: " + lines[i]);
		}

		std::string name = to_lower(trim(lines[i].substr(0, colon)));
		std::string value = trim(lines[i].substr(colon + 1));

		auto it = headers.find(name);
		if (it == headers.end()) {
			headers.emplace(name, value);
		}
		else {
			it->second += ", " + value;
		}
	}

	return lines[0];
}

std::string header_lookup(const HttpHeaders& headers, const std::string& name)
{
	auto it = headers.find(to_lower(name));
	if (it == headers.end()) return "";
	return it->second;
}

bool is_chunked(const HttpHeaders& headers)
{
	return to_lower(header_lookup(headers, "transfer-encoding")).find("chunked") != std::string::npos;
}

uint64_t parse_content_length(const std::string& value)
{
	if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw HttpParseError("Invalid Content-Length: " + value);
	}

	try {
		return std::stoull(value);
	}
	catch (const std::out_of_range&) {
		throw HttpParseError("Content-Length out of range: " + value);
	}
}

int hex_value(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

}

std::string HttpRequest::header(const std::string& name) const
{
	return header_lookup(headers, name);
}

bool HttpRequest::has_header(const std::string& name) const
{
	return headers.count(to_lower(name)) != 0;
}

std::string HttpRequest::query_param(const std::string& key) const
{
	std::stringstream ss(query);
	std::string item;
	while (std::getline(ss, item, '&')) {
		size_t eq = item.find('=');
		std::string name = item.substr(0, eq);
		if (url_decode(name) != key) continue;
		if (eq == std::string::npos) return "";
		return url_decode(item.substr(eq + 1));
	}
	return "";
}

std::string HttpResponseHead::header(const std::string& name) const
{
	return header_lookup(headers, name);
}

bool SocketReader::fill()
{
	char buf[4096];

	while (true) {
		ssize_t n = recv(fd, buf, sizeof(buf), 0);
		if (n > 0) {
			rx_buffer.append(buf, n);
			return true;
		}

		if (n == 0) return false;
		if (errno == EINTR) continue;

		// treat receive timeouts like any other broken connection
		if (errno == EWOULDBLOCK || errno == EAGAIN) {
			throw StreamReadError("Timed out waiting for peer data");
		}

		throw StreamReadError(std::string("recv failed: ") + std::strerror(errno));
	}
}

std::string SocketReader::read_head(size_t limit)
{
	size_t pos;
	while ((pos = rx_buffer.find("\r\n\r\n")) == std::string::npos) {
		if (rx_buffer.size() > limit) {
			throw HttpParseError("Message head exceeds " + std::to_string(limit) + " bytes");
		}

		if (!fill()) {
			if (rx_buffer.empty()) {
				throw StreamReadError("Connection closed before a message head arrived");
			}
			throw HttpParseError("Connection closed inside the message head");
		}
	}

	std::string head = rx_buffer.substr(0, pos + 4);
	rx_buffer.erase(0, pos + 4);
	return head;
}

std::string SocketReader::read_line(size_t limit)
{
	size_t pos;
	while ((pos = rx_buffer.find('\n')) == std::string::npos) {
		if (rx_buffer.size() > limit) {
			throw StreamReadError("Line exceeds " + std::to_string(limit) + " bytes");
		}

		if (!fill()) {
			throw StreamReadError("Connection closed mid-line");
		}
	}

	std::string line = rx_buffer.substr(0, pos);
	rx_buffer.erase(0, pos + 1);

	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}

	return line;
}

size_t SocketReader::read_some(uint8_t* buf, size_t cap)
{
	if (cap == 0) return 0;

	if (rx_buffer.empty() && !fill()) {
		return 0;
	}

	size_t n = std::min(cap, rx_buffer.size());
	std::memcpy(buf, rx_buffer.data(), n);
	rx_buffer.erase(0, n);
	return n;
}

void SocketReader::read_exact(uint8_t* buf, size_t n)
{
	size_t total = 0;
	while (total < n) {
		size_t got = read_some(buf + total, n - total);
		if (got == 0) {
			throw StreamReadError("Connection closed after " + std::to_string(total) + " of " + std::to_string(n) + " bytes");
		}
		total += got;
	}
}

HttpBodyReader HttpBodyReader::for_request(SocketReader& reader, const HttpRequest& request)
{
	if (is_chunked(request.headers)) {
		return HttpBodyReader(reader, Framing::CHUNKED);
	}

	if (request.has_header("content-length")) {
		return HttpBodyReader(reader, Framing::LENGTH, parse_content_length(request.header("content-length")));
	}

	return HttpBodyReader(reader, Framing::NONE);
}

HttpBodyReader HttpBodyReader::for_response(SocketReader& reader, const HttpResponseHead& head)
{
	if (head.status < 200 || head.status == 204 || head.status == 304) {
		return HttpBodyReader(reader, Framing::NONE);
	}

	if (is_chunked(head.headers)) {
		return HttpBodyReader(reader, Framing::CHUNKED);
	}

	if (!head.header("content-length").empty()) {
		return HttpBodyReader(reader, Framing::LENGTH, parse_content_length(head.header("content-length")));
	}

	return HttpBodyReader(reader, Framing::UNTIL_CLOSE);
}

size_t HttpBodyReader::read(uint8_t* buf, size_t cap)
{
	if (finished || cap == 0) return 0;

	if (first_read_hook) {
		auto hook = std::move(first_read_hook);
		first_read_hook = nullptr;
		hook();
	}

	switch (framing) {
		case Framing::NONE: {
			finished = true;
			return 0;
		}

		case Framing::LENGTH: {
			if (remaining == 0) {
				finished = true;
				return 0;
			}

			size_t want = static_cast<size_t>(std::min<uint64_t>(cap, remaining));
			size_t n = reader.read_some(buf, want);
			if (n == 0) {
				throw StreamReadError("Connection closed with " + std::to_string(remaining) + " body bytes outstanding");
			}

			remaining -= n;
			return n;
		}

		case Framing::UNTIL_CLOSE: {
			size_t n = reader.read_some(buf, cap);
			if (n == 0) finished = true;
			return n;
		}

		case Framing::CHUNKED: {
			return read_chunked(buf, cap);
		}
	}

	return 0;
}

size_t HttpBodyReader::read_chunked(uint8_t* buf, size_t cap)
{
	while (remaining == 0) {
		if (chunk_started) {
			if (!reader.read_line().empty()) {
				throw StreamReadError("Malformed chunk terminator");
			}
		}

		std::string line = reader.read_line();
		size_t ext = line.find(';');
		if (ext != std::string::npos) {
			line.erase(ext);
		}
		line = trim(line);

		if (line.empty() || line.size() > 16) {
			throw StreamReadError("Malformed chunk size line");
		}

		uint64_t size = 0;
		for (char c : line) {
			int v = hex_value(c);
			if (v < 0) {
				throw StreamReadError("Malformed chunk size: " + line);
			}
			size = (size << 4) | static_cast<uint64_t>(v);
		}

		if (size == 0) {
			// skip trailers
			while (!reader.read_line().empty()) {}
			finished = true;
			return 0;
		}

		remaining = size;
		chunk_started = true;
	}

	size_t want = static_cast<size_t>(std::min<uint64_t>(cap, remaining));
	size_t n = reader.read_some(buf, want);
	if (n == 0) {
		throw StreamReadError("Connection closed inside a chunk");
	}

	remaining -= n;
	return n;
}

void ChunkedStreamWriter::write(const uint8_t* data, size_t len)
{
	// an empty chunk would end the body
	if (len == 0) return;

	if (finished) {
		throw std::logic_error("Chunked body already finished");
	}

	char size_line[32];
	int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);

	std::vector<uint8_t> frame;
	frame.reserve(n + len + 2);
	frame.insert(frame.end(), size_line, size_line + n);
	frame.insert(frame.end(), data, data + len);
	frame.push_back('\r');
	frame.push_back('\n');

	out.write(frame.data(), frame.size());
}

void ChunkedStreamWriter::finish()
{
	if (finished) return;

	static const char terminator[] = "0\r\n\r\n";
	out.write(reinterpret_cast<const uint8_t*>(terminator), sizeof(terminator) - 1);
	out.flush();
	finished = true;
}

HttpRequest parse_request(const std::string& head)
{
	HttpRequest request;
	std::string start = split_head(head, request.headers);

	std::istringstream iss(start);
	if (!(iss >> request.method >> request.target >> request.version)) {
		throw HttpParseError("Malformed request line: " + start);
	}

	std::string extra;
	if (iss >> extra) {
		throw HttpParseError("Malformed request line: " + start);
	}

	if (request.version.rfind("HTTP/1.", 0) != 0) {
		throw HttpParseError("Unsupported protocol version: " + request.version);
	}

	if (request.target.empty() || request.target[0] != '/') {
		throw HttpParseError("Request target must be an absolute path");
	}

	size_t q = request.target.find('?');
	request.path = request.target.substr(0, q);
	if (q != std::string::npos) {
		request.query = request.target.substr(q + 1);
	}

	return request;
}

HttpResponseHead parse_response(const std::string& head)
{
	HttpResponseHead response;
	std::string start = split_head(head, response.headers);

	size_t sp1 = start.find(' ');
	if (sp1 == std::string::npos || start.rfind("HTTP/1.", 0) != 0) {
		throw HttpParseError("Malformed status line: " + start);
	}

	response.version = start.substr(0, sp1);

	size_t sp2 = start.find(' ', sp1 + 1);
	std::string code = start.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
	if (code.size() != 3 || !std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw HttpParseError("Malformed status code: " + code);
	}

	response.status = std::stoi(code);
	if (sp2 != std::string::npos) {
		response.reason = start.substr(sp2 + 1);
	}

	return response;
}

std::string format_response_head(int status, const std::vector<std::pair<std::string, std::string>>& headers)
{
	std::string head = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
	for (const auto& h : headers) {
		head.append(h.first + ": " + h.second + "\r\n");
	}
	head.append("\r\n");
	return head;
}

std::string format_request_head(const std::string& method, const std::string& target, const std::vector<std::pair<std::string, std::string>>& headers)
{
	std::string head = method + " " + target + " HTTP/1.1\r\n";
	for (const auto& h : headers) {
		head.append(h.first + ": " + h.second + "\r\n");
	}
	head.append("\r\n");
	return head;
}

const char* reason_phrase(int status)
{
	switch (status) {
		case 100: return "Continue";
		case 200: return "OK";
		case 400: return "Bad Request";
		case 401: return "Unauthorized";
		case 403: return "Forbidden";
		case 404: return "Not Found";
		case 405: return "Method Not Allowed";
		case 408: return "Request Timeout";
		case 409: return "Conflict";
		case 413: return "Payload Too Large";
		case 500: return "Internal Server Error";
		case 503: return "Service Unavailable";
		default:  return "Unknown";
	}
}

std::string url_decode(const std::string& encoded)
{
	std::string out;
	out.reserve(encoded.size());

	for (size_t i = 0; i < encoded.size(); i++) {
		if (encoded[i] != '%') {
			out.push_back(encoded[i]);
			continue;
		}

		if (i + 2 >= encoded.size()) {
			throw HttpParseError("Truncated percent escape");
		}

		int hi = hex_value(encoded[i + 1]);
		int lo = hex_value(encoded[i + 2]);
		if (hi < 0 || lo < 0) {
			throw HttpParseError("Invalid percent escape");
		}

		out.push_back(static_cast<char>((hi << 4) | lo));
		i += 2;
	}

	return out;
}

std::string url_encode(const std::string& raw)
{
	static const char hex[] = "0123456789ABCDEF";

	std::string out;
	for (unsigned char c : raw) {
		if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
			out.push_back(static_cast<char>(c));
		}
		else {
			out.push_back('%');
			out.push_back(hex[c >> 4]);
			out.push_back(hex[c & 0x0F]);
		}
	}

	return out;
}
