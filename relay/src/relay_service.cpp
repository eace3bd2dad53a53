#include "relay_service.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <optional>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr size_t MAX_FILE_ID_BYTES = 255;
constexpr size_t LINGER_DRAIN_BYTES = 1024 * 1024;

std::string html_escape(const std::string& raw)
{
	std::string out;
	for (char c : raw) {
		switch (c) {
			case '&': out.append("&amp;"); break;
			case '<': out.append("&lt;"); break;
			case '>': out.append("&gt;"); break;
			case '"': out.append("&quot;"); break;
			case '\'': out.append("&#39;"); break;
			default: out.push_back(c);
		}
	}
	return out;
}

// filename parameter of Content-Disposition
std::string quote_filename(const std::string& raw)
{
	std::string out;
	for (char c : raw) {
		if (c == '"' || c == '\\') out.push_back('\\');
		if (c == '\r' || c == '\n') continue;
		out.push_back(c);
	}
	return out;
}

void set_recv_timeout(int clientfd, std::chrono::seconds timeout)
{
	struct timeval tv;
	tv.tv_sec = static_cast<time_t>(timeout.count());
	tv.tv_usec = 0;
	setsockopt(clientfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

// reads off what the client is still sending so close() does not reset the
// connection before it has seen the error response
void linger_close(int clientfd)
{
	shutdown(clientfd, SHUT_WR);
	set_recv_timeout(clientfd, std::chrono::seconds(2));

	char buf[4096];
	size_t drained = 0;
	while (drained < LINGER_DRAIN_BYTES) {
		ssize_t n = recv(clientfd, buf, sizeof(buf), 0);
		if (n <= 0) break;
		drained += static_cast<size_t>(n);
	}
}

std::string bearer_token(const HttpRequest& request)
{
	std::string header = request.header("authorization");
	if (header.size() > 7) {
		std::string scheme = header.substr(0, 7);
		for (char& c : scheme) {
			c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}
		if (scheme == "bearer ") {
			size_t start = header.find_first_not_of(' ', 7);
			if (start != std::string::npos) return header.substr(start);
		}
	}

	return request.query_param("token");
}

}

RelayService::RelayService(const ServerConfig& config, std::shared_ptr<Logger> logger)
	: cfg(config),
	  logger(std::move(logger)),
	  tokens(TokenPolicy{config.token_lifetime, config.token_extension})
{
	cfg.validate();

	if (cfg.auth_mode == AuthMode::BASIC) {
		verifier = std::make_unique<CredentialVerifier>(cfg.username, cfg.password);
	}

	if (cfg.auth_mode == AuthMode::TOKEN) {
		sweeper = std::make_unique<TokenSweeper>(tokens, *this->logger, cfg.token_sweep_interval);
	}
}

RelayService::~RelayService()
{
	if (sweeper) {
		sweeper->stop();
	}
}

void RelayService::handle_client(int clientfd)
{
	SocketReader reader(clientfd);
	bool rejected = false;

	try {
		set_recv_timeout(clientfd, cfg.head_timeout);
		HttpRequest request = parse_request(reader.read_head());

		// bodies and pairing waits have their own limits
		set_recv_timeout(clientfd, std::chrono::seconds(0));

		route(clientfd, reader, request);
	}
	catch (const RelayError& e) {
		logger->log_event(Logger::LogEvent::REQUEST_REJECTED, {
			{"status", e.http_status()},
			{"error", e.what()}
		});
		send_error(clientfd, e);
		rejected = true;
	}
	catch (const HttpParseError& e) {
		logger->log_event(Logger::LogEvent::REQUEST_REJECTED, {
			{"status", 400},
			{"error", e.what()}
		});
		send_error(clientfd, BadRequestError(e.what()));
		rejected = true;
	}
	catch (const StreamReadError& e) {
		// the peer is gone or silent, there is nobody to answer
		logger->log_event(Logger::LogEvent::REQUEST_REJECTED, {
			{"error", e.what()}
		});
	}
	catch (const std::exception& e) {
		logger->log_event(Logger::LogEvent::INTERNAL_ERROR, {{"error", e.what()}});
		send_error(clientfd, InternalError("Internal server error"));
		rejected = true;
	}

	if (rejected) {
		linger_close(clientfd);
	}

	close(clientfd);
}

void RelayService::route(int clientfd, SocketReader& reader, const HttpRequest& request)
{
	const std::string& method = request.method;

	if (request.path == "/") {
		if (method != "GET") {
			send_response(clientfd, 405, "text/plain", "Method not allowed\n", {{"Allow", "GET"}});
			return;
		}
		send_response(clientfd, 200, "text/html; charset=utf-8", render_dashboard());
		return;
	}

	if (request.path == "/api/streams") {
		send_response(clientfd, 200, "application/json", render_stream_list());
		return;
	}

	if (request.path == "/token") {
		if (cfg.auth_mode != AuthMode::TOKEN) {
			throw NotFoundError("Tokens are not enabled on this server");
		}
		if (method != "POST" && method != "GET") {
			send_response(clientfd, 405, "text/plain", "Method not allowed\n", {{"Allow", "GET, POST"}});
			return;
		}
		handle_issue_token(clientfd);
		return;
	}

	std::string file_id = file_id_from_path(request.path);

	if (method == "PUT") {
		handle_upload(clientfd, reader, request, file_id);
	}
	else if (method == "GET") {
		handle_download(clientfd, request, file_id);
	}
	else {
		send_response(clientfd, 405, "text/plain", "Method not allowed\n", {{"Allow", "GET, PUT"}});
	}
}

std::string RelayService::file_id_from_path(const std::string& path) const
{
	std::string file_id = url_decode(path.substr(1));

	if (file_id.empty()) {
		throw BadRequestError("Missing file name");
	}
	if (file_id.find('/') != std::string::npos) {
		throw BadRequestError("File name must not contain '/'");
	}
	if (file_id.size() > MAX_FILE_ID_BYTES) {
		throw BadRequestError("File name too long");
	}

	return file_id;
}

std::string RelayService::authorize(const HttpRequest& request)
{
	switch (cfg.auth_mode) {
		case AuthMode::NONE: {
			return "";
		}

		case AuthMode::BASIC: {
			CredentialVerifier::Result result = verifier->verify(request.header("authorization"));

			if (result.verdict == CredentialVerifier::Verdict::INTERNAL) {
				logger->log_event(Logger::LogEvent::INTERNAL_ERROR, {{"error", result.reason}});
				throw InternalError("Authentication failed");
			}

			if (result.verdict != CredentialVerifier::Verdict::OK) {
				logger->log_event(Logger::LogEvent::CLIENT_AUTH_FAILURE, {
					{"path", request.path},
					{"reason", result.reason}
				});
				throw UnauthorizedError("Invalid username or password");
			}

			logger->log_event(Logger::LogEvent::CLIENT_AUTH_SUCCESS, {{"path", request.path}});
			return "";
		}

		case AuthMode::TOKEN: {
			std::string token = bearer_token(request);

			if (!tokens.validate_and_extend(token)) {
				logger->log_event(Logger::LogEvent::TOKEN_REJECTED, {
					{"path", request.path},
					{"reason", token.empty() ? "missing token" : "unknown or expired token"}
				});
				throw UnauthorizedError("Invalid or expired token");
			}

			logger->log_event(Logger::LogEvent::CLIENT_AUTH_SUCCESS, {{"path", request.path}});
			return token;
		}
	}

	throw InternalError("Unknown auth mode");
}

std::shared_ptr<RelaySession> RelayService::open_session(const std::string& file_id, RelayRole role,
		const std::string& token, bool& paired)
{
	auto candidate = std::make_shared<RelaySession>(file_id, role, token, cfg.channel_capacity);

	if (!token.empty()) {
		tokens.adjust_active_count(token, 1);
		candidate->set_release_hook([this, token] {
			tokens.adjust_active_count(token, -1);
		});
	}

	StreamRegistry::Rendezvous result{candidate, false};

	try {
		if (cfg.pairing == PairingMode::EITHER_ORDER) {
			result = streams.rendezvous(candidate);
		}
		else {
			streams.register_session(candidate);
		}
	}
	catch (const RelayError&) {
		candidate->release();
		throw;
	}

	paired = result.claimed;
	if (!paired) {
		return candidate;
	}

	// the candidate never entered the registry
	candidate->release();

	if (!result.session->ready.set(RelaySession::Clock::now())) {
		throw TimeoutError("The waiting side gave up on " + file_id);
	}

	return result.session;
}

void RelayService::handle_upload(int clientfd, SocketReader& reader, const HttpRequest& request, const std::string& file_id)
{
	std::string token = authorize(request);

	auto body = std::make_unique<HttpBodyReader>(HttpBodyReader::for_request(reader, request));

	std::string expect = request.header("expect");
	for (char& c : expect) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (expect == "100-continue") {
		body->on_first_read([clientfd] {
			SocketStreamWriter(clientfd).write(std::string("HTTP/1.1 100 Continue\r\n\r\n"));
		});
	}

	bool paired = false;
	std::shared_ptr<RelaySession> session;

	try {
		session = open_session(file_id, RelayRole::UPLOADER, token, paired);
	}
	catch (const ConflictError&) {
		logger->log_event(Logger::LogEvent::UPLOAD_CONFLICT, {{"file", file_id}});
		throw;
	}

	if (paired) {
		logger->log_event(Logger::LogEvent::DOWNLOAD_START, {
			{"file", file_id},
			{"paired_by", role_to_string(RelayRole::UPLOADER)}
		});
	}
	else {
		logger->log_event(Logger::LogEvent::UPLOAD_WAITING, {{"file", file_id}});
	}

	RelayCoordinator::Options options;
	options.pair_timeout = cfg.pair_timeout;
	if (!token.empty()) {
		// a transfer in progress keeps its token alive
		options.on_progress = [this, token](uint64_t) {
			tokens.touch(token);
		};
	}

	RelayCoordinator coordinator(streams, *logger, options);
	coordinator.start(session, std::move(body));

	std::optional<TransferOutcome> outcome = session->outcome.wait();
	coordinator.join();

	if (!token.empty()) {
		tokens.touch(token);
	}

	if (!outcome) {
		throw InternalError("Upload task failed");
	}

	switch (outcome->status) {
		case TransferOutcome::Status::SUCCESS: {
			std::string message = outcome->partial
				? "Upload ended early: download client disconnected\n"
				: "Upload completed successfully\n";
			send_response(clientfd, 200, "text/plain", message);
			if (outcome->partial) {
				// the rest of the body is still in flight
				linger_close(clientfd);
			}
			return;
		}
		case TransferOutcome::Status::TIMEOUT:
		case TransferOutcome::Status::UNPAIRED:
			throw BadRequestError("Upload failed: " + outcome->reason);
		case TransferOutcome::Status::READ_ERROR:
			throw UpstreamReadError("Upload failed: " + outcome->reason);
		case TransferOutcome::Status::INTERNAL:
			throw InternalError("Upload task failed: " + outcome->reason);
	}
}

void RelayService::handle_download(int clientfd, const HttpRequest& request, const std::string& file_id)
{
	std::string token = authorize(request);

	std::shared_ptr<RelaySession> session;
	bool paired = true;

	try {
		if (cfg.pairing == PairingMode::EITHER_ORDER) {
			session = open_session(file_id, RelayRole::DOWNLOADER, token, paired);
		}
		else {
			session = streams.claim(file_id, RelayRole::DOWNLOADER, token);
			if (!session->ready.set(RelaySession::Clock::now())) {
				throw TimeoutError("The upload gave up on " + file_id);
			}
		}
	}
	catch (const NotFoundError&) {
		logger->log_event(Logger::LogEvent::DOWNLOAD_NOT_FOUND, {{"file", file_id}});
		throw NotFoundError("No active upload stream for this file");
	}

	// every way out of here must release the pump, even before deliver() runs
	struct ReceiverGuard {
		ByteChannel& channel;
		~ReceiverGuard() { channel.close_receiver(); }
	} guard{session->channel()};

	if (!paired) {
		logger->log_event(Logger::LogEvent::DOWNLOAD_WAITING, {{"file", file_id}});

		RelayCoordinator::PairResult result = RelayCoordinator::await_pair(streams, session, cfg.pair_timeout);
		if (result == RelayCoordinator::PairResult::TIMED_OUT) {
			logger->log_event(Logger::LogEvent::PAIR_TIMEOUT, {
				{"file", file_id},
				{"side", role_to_string(RelayRole::DOWNLOADER)}
			});
			throw TimeoutError("Timeout waiting for upload client");
		}
		if (result == RelayCoordinator::PairResult::DROPPED) {
			throw InternalError("Ready signal dropped");
		}
	}

	logger->log_event(Logger::LogEvent::DOWNLOAD_START, {{"file", file_id}});

	SocketStreamWriter socket_writer(clientfd);
	ChunkedStreamWriter body(socket_writer);

	try {
		socket_writer.write(format_response_head(200, {
			{"Content-Type", "application/octet-stream"},
			{"Content-Disposition", "attachment; filename=\"" + quote_filename(file_id) + "\""},
			{"Transfer-Encoding", "chunked"},
			{"Connection", "close"}
		}));

		uint64_t delivered = RelayCoordinator::deliver(*session, body);
		body.finish();

		logger->log_event(Logger::LogEvent::DOWNLOAD_COMPLETE, {
			{"file", file_id},
			{"bytes", delivered}
		});
	}
	catch (const UpstreamReadError& e) {
		// no terminating chunk: the client sees a broken body, not a short file
		logger->log_event(Logger::LogEvent::DOWNLOAD_FAILURE, {
			{"file", file_id},
			{"error", e.what()}
		});
		shutdown(clientfd, SHUT_RDWR);
	}
	catch (const std::runtime_error& e) {
		// socket write failed; the guard closes the receiving end so the upload ends partial
		logger->log_event(Logger::LogEvent::DOWNLOAD_ABORT, {
			{"file", file_id},
			{"error", e.what()}
		});
	}

	if (!token.empty()) {
		tokens.touch(token);
	}
}

void RelayService::handle_issue_token(int clientfd)
{
	std::string token = tokens.issue();

	logger->log_event(Logger::LogEvent::TOKEN_ISSUED, {
		{"live", static_cast<uint64_t>(tokens.live_count())}
	});

	json body;
	body["token"] = token;
	body["expires_in"] = tokens.policy().lifetime.count();

	send_response(clientfd, 200, "application/json", body.dump() + "\n");
}

std::string RelayService::render_stream_list() const
{
	json body;
	body["active_streams"] = streams.list_active();

	if (cfg.auth_mode == AuthMode::TOKEN) {
		body["live_tokens"] = tokens.live_count();
	}

	return body.dump() + "\n";
}

std::string RelayService::render_dashboard() const
{
	std::string rows;
	for (const StreamRegistry::ActiveStream& stream : streams.snapshot()) {
		rows.append("      <li><code>" + html_escape(stream.file_id) + "</code> &mdash; "
			+ role_to_string(stream.waiting_side) + " waiting "
			+ std::to_string(stream.waiting_for.count()) + "s</li>\n");
	}
	if (rows.empty()) {
		rows = "      <li>none</li>\n";
	}

	std::string port = std::to_string(cfg.port);
	std::string auth_flag;
	std::string usage;

	switch (cfg.auth_mode) {
		case AuthMode::NONE:
			usage = "<p>Uploads and downloads need no credentials.</p>";
			break;
		case AuthMode::BASIC:
			usage = "<p>Start Beam with <code>beam &lt;username&gt; &lt;password&gt;</code> then authenticate uploads and downloads using HTTP Basic auth.</p>";
			auth_flag = "-u USER:PASS ";
			break;
		case AuthMode::TOKEN:
			usage = "<p>Request a token with <code>curl -X POST http://localhost:" + port + "/token</code> and present it as a Bearer token on both sides.</p>";
			auth_flag = "-H 'Authorization: Bearer TOKEN' ";
			break;
	}

	std::string tokens_line;
	if (cfg.auth_mode == AuthMode::TOKEN) {
		tokens_line = "    <p>Live tokens: " + std::to_string(tokens.live_count()) + "</p>\n";
	}

	return "<!DOCTYPE html>\n"
		"<html lang=\"en\">\n"
		"<head>\n"
		"  <meta charset=\"utf-8\" />\n"
		"  <title>Beam Dashboard</title>\n"
		"  <style>\n"
		"    body { font-family: sans-serif; margin: 2rem; max-width: 40rem; }\n"
		"    h1 { margin-bottom: 0.5rem; }\n"
		"    section { margin-top: 1.5rem; }\n"
		"    code { background: #f4f4f4; padding: 0.2rem 0.4rem; border-radius: 3px; }\n"
		"  </style>\n"
		"</head>\n"
		"<body>\n"
		"  <h1>Beam Dashboard</h1>\n"
		"  " + usage + "\n"
		"  <section>\n"
		"    <h2>Active Streams</h2>\n"
		"    <ul>\n" + rows + "    </ul>\n"
		+ tokens_line +
		"  </section>\n"
		"  <section>\n"
		"    <h2>Usage</h2>\n"
		"    <ol>\n"
		"      <li>Upload: <code>curl " + auth_flag + "-T file.zip http://localhost:" + port + "/file.zip</code></li>\n"
		"      <li>Download: <code>curl " + auth_flag + "http://localhost:" + port + "/file.zip -o file.zip</code></li>\n"
		"    </ol>\n"
		"  </section>\n"
		"</body>\n"
		"</html>\n";
}

void RelayService::send_response(int clientfd, int status, const std::string& content_type,
		const std::string& body, const HeaderList& extra)
{
	HeaderList headers = {
		{"Content-Type", content_type},
		{"Content-Length", std::to_string(body.size())},
		{"Connection", "close"}
	};
	headers.insert(headers.end(), extra.begin(), extra.end());

	SocketStreamWriter writer(clientfd);
	writer.write(format_response_head(status, headers) + body);
}

void RelayService::send_error(int clientfd, const RelayError& error)
{
	HeaderList extra;
	if (error.kind() == RelayError::Kind::UNAUTHORIZED) {
		extra.emplace_back("WWW-Authenticate", cfg.auth_mode == AuthMode::TOKEN
			? "Bearer realm=\"beam\""
			: "Basic realm=\"beam\"");
	}

	try {
		send_response(clientfd, error.http_status(), "text/plain", std::string(error.what()) + "\n", extra);
	}
	catch (const std::runtime_error&) {
		logger->log_event(Logger::LogEvent::REQUEST_REJECTED, {
			{"status", error.http_status()},
			{"error", "client gone before the error response"}
		});
	}
}
