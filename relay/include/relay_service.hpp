#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "credential_verifier.hpp"
#include "http_wire.hpp"
#include "logger.hpp"
#include "relay_coordinator.hpp"
#include "relay_errors.hpp"
#include "stream_registry.hpp"
#include "token_ledger.hpp"

#pragma once

/*
*	Everything one connection needs: auth, the registry, the token ledger and
*	the route table. Connection threads share it through shared_ptr so it
*	outlives the accept loop for as long as a transfer is still running.
*
*	GET  /               dashboard
*	GET  /api/streams    active FileIds as JSON
*	POST /token          issue a capability token (token mode)
*	PUT  /{FileId}       upload, answered once the relay is over
*	GET  /{FileId}       download, chunked stream straight from the uploader
*/
class RelayService
{
	public:
		RelayService(const ServerConfig& config, std::shared_ptr<Logger> logger);
		~RelayService();

		RelayService(const RelayService&) = delete;
		RelayService& operator=(const RelayService&) = delete;

		// owns clientfd and closes it
		void handle_client(int clientfd);

		StreamRegistry& registry() { return streams; }
		TokenLedger& ledger() { return tokens; }
		const ServerConfig& config() const { return cfg; }

		std::string render_dashboard() const;
		std::string render_stream_list() const;

	private:
		using HeaderList = std::vector<std::pair<std::string, std::string>>;

		ServerConfig cfg;
		std::shared_ptr<Logger> logger;

		StreamRegistry streams;
		TokenLedger tokens;
		std::unique_ptr<CredentialVerifier> verifier;
		std::unique_ptr<TokenSweeper> sweeper;

		void route(int clientfd, SocketReader& reader, const HttpRequest& request);

		// token owning the request ("" outside token mode); throws UnauthorizedError / InternalError
		std::string authorize(const HttpRequest& request);

		void handle_upload(int clientfd, SocketReader& reader, const HttpRequest& request, const std::string& file_id);
		void handle_download(int clientfd, const HttpRequest& request, const std::string& file_id);
		void handle_issue_token(int clientfd);

		// registers or pairs a new session for this side; `paired` tells which happened
		std::shared_ptr<RelaySession> open_session(const std::string& file_id, RelayRole role,
				const std::string& token, bool& paired);

		std::string file_id_from_path(const std::string& path) const;

		void send_response(int clientfd, int status, const std::string& content_type,
				const std::string& body, const HeaderList& extra = {});
		void send_error(int clientfd, const RelayError& error);
};
