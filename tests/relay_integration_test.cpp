#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "client.hpp"
#include "server.hpp"
#include "socket_stream_writer.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using test_support::make_payload;
using test_support::wait_until;

class RelayServerTest : public ::testing::Test
{
	protected:
		std::unique_ptr<Server> server;
		std::thread accept_thread;

		static ServerConfig base_config()
		{
			ServerConfig config;
			config.port = 0;
			config.bind_address = "127.0.0.1";
			config.pair_timeout = 10s;
			return config;
		}

		void start(const ServerConfig& config)
		{
			server = std::make_unique<Server>(config, test_support::quiet_logger());
			server->bind_and_listen();
			accept_thread = std::thread([this] { server->run(); });
		}

		void TearDown() override
		{
			if (server) {
				server->stop();
			}
			if (accept_thread.joinable()) {
				accept_thread.join();
			}
		}

		Client client(Client::Credentials credentials = Client::Credentials())
		{
			return Client(Client::Endpoint{"127.0.0.1", server->port()}, credentials);
		}

		StreamRegistry& registry() { return server->service()->registry(); }

		bool wait_for_stream(const std::string& file_id)
		{
			return wait_until([&] {
				for (const std::string& id : registry().list_active()) {
					if (id == file_id) return true;
				}
				return false;
			});
		}

		int raw_connect()
		{
			int sock = socket(AF_INET, SOCK_STREAM, 0);
			sockaddr_in addr{};
			addr.sin_family = AF_INET;
			addr.sin_port = htons(server->port());
			inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
			if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
				close(sock);
				throw std::runtime_error("connect failed");
			}
			return sock;
		}

		// full relay with the upload arriving first
		void relay_and_check(const std::string& file_id, const std::string& payload)
		{
			auto upload = std::async(std::launch::async, [&] {
				return client().upload(file_id, payload);
			});

			ASSERT_TRUE(wait_for_stream(file_id));

			StringSink sink;
			Client::Response download = client().download(file_id, sink);
			Client::Response uploaded = upload.get();

			EXPECT_EQ(download.status, 200);
			EXPECT_EQ(uploaded.status, 200);
			EXPECT_EQ(sink.str(), payload);
		}
};

TEST_F(RelayServerTest, RelaysBinaryPayloadUploadFirst)
{
	start(base_config());
	relay_and_check("photo.raw", make_payload(200 * 1024));
	EXPECT_EQ(registry().size(), 0u);
}

TEST_F(RelayServerTest, RelaysEmptyPayload)
{
	start(base_config());
	relay_and_check("empty.txt", "");
}

TEST_F(RelayServerTest, DownloadHeadersNameTheFile)
{
	start(base_config());

	auto upload = std::async(std::launch::async, [&] {
		return client().upload("notes.txt", "hello");
	});
	ASSERT_TRUE(wait_for_stream("notes.txt"));

	StringSink sink;
	Client::Response download = client().download("notes.txt", sink);
	upload.get();

	EXPECT_EQ(download.headers["content-type"], "application/octet-stream");
	EXPECT_EQ(download.headers["content-disposition"], "attachment; filename=\"notes.txt\"");
	EXPECT_EQ(download.headers["transfer-encoding"], "chunked");
}

TEST_F(RelayServerTest, FileIdIsPercentDecoded)
{
	start(base_config());
	relay_and_check("quarterly report (final).pdf", make_payload(5000));
}

TEST_F(RelayServerTest, DownloadWithoutUploadIsNotFound)
{
	start(base_config());

	StringSink sink;
	Client::Response response = client().download("ghost.bin", sink);
	EXPECT_EQ(response.status, 404);
	EXPECT_TRUE(sink.str().empty());
}

TEST_F(RelayServerTest, SecondUploadConflicts)
{
	start(base_config());

	std::string payload = make_payload(1000);
	auto first = std::async(std::launch::async, [&] {
		return client().upload("dup.bin", payload);
	});
	ASSERT_TRUE(wait_for_stream("dup.bin"));

	Client::Response second = client().upload("dup.bin", "other");
	EXPECT_EQ(second.status, 409);

	StringSink sink;
	EXPECT_EQ(client().download("dup.bin", sink).status, 200);
	EXPECT_EQ(first.get().status, 200);
	EXPECT_EQ(sink.str(), payload);
}

TEST_F(RelayServerTest, PairTimeoutFailsTheUploadAndFreesTheName)
{
	ServerConfig config = base_config();
	config.pair_timeout = 200ms;
	start(config);

	Client::Response timed_out = client().upload("late.bin", "nobody came");
	EXPECT_EQ(timed_out.status, 400);
	EXPECT_EQ(timed_out.body, "Upload failed: Timeout waiting for download client\n");
	EXPECT_EQ(registry().size(), 0u);

	StringSink sink;
	EXPECT_EQ(client().download("late.bin", sink).status, 404);

	// the name can be used again right away
	auto retry = std::async(std::launch::async, [&] {
		return client().upload("late.bin", "second try");
	});
	ASSERT_TRUE(wait_for_stream("late.bin"));
	EXPECT_EQ(client().download("late.bin", sink).status, 200);
	EXPECT_EQ(retry.get().status, 200);
	EXPECT_EQ(sink.str(), "second try");
}

TEST_F(RelayServerTest, ConcurrentTransfersStayIsolated)
{
	start(base_config());

	const int transfers = 8;
	std::vector<std::string> payloads;
	for (int i = 0; i < transfers; i++) {
		payloads.push_back(make_payload(64 * 1024 + i * 997, static_cast<uint32_t>(i + 1)));
	}

	std::vector<std::future<Client::Response>> uploads;
	for (int i = 0; i < transfers; i++) {
		uploads.push_back(std::async(std::launch::async, [this, &payloads, i] {
			return client().upload("file-" + std::to_string(i), payloads[i]);
		}));
	}

	ASSERT_TRUE(wait_until([&] { return registry().size() == static_cast<size_t>(transfers); }));

	std::vector<std::future<std::string>> downloads;
	for (int i = 0; i < transfers; i++) {
		downloads.push_back(std::async(std::launch::async, [this, i] {
			StringSink sink;
			Client::Response response = client().download("file-" + std::to_string(i), sink);
			return response.status == 200 ? sink.str() : std::string("status ") + std::to_string(response.status);
		}));
	}

	for (int i = 0; i < transfers; i++) {
		EXPECT_EQ(downloads[i].get(), payloads[i]) << "transfer " << i;
		EXPECT_EQ(uploads[i].get().status, 200) << "transfer " << i;
	}
}

TEST_F(RelayServerTest, EitherOrderPairsDownloadFirst)
{
	ServerConfig config = base_config();
	config.pairing = PairingMode::EITHER_ORDER;
	start(config);

	std::string payload = make_payload(300 * 1024);

	auto download = std::async(std::launch::async, [&] {
		StringSink sink;
		Client::Response response = client().download("early.bin", sink);
		return std::make_pair(response.status, sink.str());
	});

	ASSERT_TRUE(wait_for_stream("early.bin"));
	EXPECT_EQ(registry().snapshot()[0].waiting_side, RelayRole::DOWNLOADER);

	Client::Response upload = client().upload("early.bin", payload);
	auto received = download.get();

	EXPECT_EQ(upload.status, 200);
	EXPECT_EQ(received.first, 200);
	EXPECT_EQ(received.second, payload);
}

TEST_F(RelayServerTest, DownloaderResetBeforePairingEndsUploadPartial)
{
	ServerConfig config = base_config();
	config.pairing = PairingMode::EITHER_ORDER;
	start(config);

	int downloader = raw_connect();
	SocketStreamWriter(downloader).write(std::string("GET /gone.bin HTTP/1.1\r\n\r\n"));
	ASSERT_TRUE(wait_for_stream("gone.bin"));

	// abortive close: the response head cannot be written once paired
	linger reset{1, 0};
	ASSERT_EQ(setsockopt(downloader, SOL_SOCKET, SO_LINGER, &reset, sizeof(reset)), 0);
	close(downloader);

	// larger than the channel can buffer, so the pump needs the receiver gone to finish
	Client::Response upload = client().upload("gone.bin", make_payload(1024 * 1024));
	EXPECT_EQ(upload.status, 200);
	EXPECT_EQ(upload.body, "Upload ended early: download client disconnected\n");
	EXPECT_EQ(registry().size(), 0u);
}

TEST_F(RelayServerTest, ActiveTransferOutlivesTheTokenLifetime)
{
	ServerConfig config = base_config();
	config.auth_mode = AuthMode::TOKEN;
	config.token_lifetime = 1s;
	config.token_extension = 1s;
	config.token_sweep_interval = 100ms;
	start(config);

	std::string token = client().issue_token();
	std::string payload = make_payload(256 * 1024);

	auto upload = std::async(std::launch::async, [&] {
		test_support::SlicedSource source(payload, 8 * 1024, 100ms);
		return client({"", "", token}).upload("slow.bin", source, payload.size());
	});
	ASSERT_TRUE(wait_for_stream("slow.bin"));

	StringSink sink;
	auto started = std::chrono::steady_clock::now();
	Client::Response download = client({"", "", token}).download("slow.bin", sink);
	auto elapsed = std::chrono::steady_clock::now() - started;

	EXPECT_EQ(download.status, 200);
	EXPECT_EQ(upload.get().status, 200);
	EXPECT_EQ(sink.str(), payload);
	EXPECT_GT(elapsed, 2s);

	// still accepted: a missing file is 404, not 401
	EXPECT_TRUE(server->service()->ledger().info(token).has_value());
	EXPECT_EQ(client({"", "", token}).download("nothing.bin", sink).status, 404);
}

TEST_F(RelayServerTest, EitherOrderDownloaderTimesOut)
{
	ServerConfig config = base_config();
	config.pairing = PairingMode::EITHER_ORDER;
	config.pair_timeout = 200ms;
	start(config);

	StringSink sink;
	EXPECT_EQ(client().download("nobody.bin", sink).status, 408);
	EXPECT_EQ(registry().size(), 0u);
}

TEST_F(RelayServerTest, InvalidFileIdsAreBadRequests)
{
	start(base_config());

	EXPECT_EQ(client().get("/a%2Fb").status, 400);
	EXPECT_EQ(client().get("/bad%zz").status, 400);
	EXPECT_EQ(client().get("/" + std::string(256, 'n')).status, 400);
}

TEST_F(RelayServerTest, DashboardAndStreamList)
{
	start(base_config());

	Client::Response dashboard = client().get("/");
	EXPECT_EQ(dashboard.status, 200);
	EXPECT_NE(dashboard.body.find("Beam Dashboard"), std::string::npos);

	auto upload = std::async(std::launch::async, [&] {
		return client().upload("listed.bin", "x");
	});
	ASSERT_TRUE(wait_for_stream("listed.bin"));

	Client::Response list = client().get("/api/streams");
	EXPECT_EQ(list.status, 200);
	auto body = nlohmann::json::parse(list.body);
	EXPECT_EQ(body["active_streams"], nlohmann::json::array({"listed.bin"}));

	dashboard = client().get("/");
	EXPECT_NE(dashboard.body.find("listed.bin"), std::string::npos);

	StringSink sink;
	client().download("listed.bin", sink);
	EXPECT_EQ(upload.get().status, 200);
}

TEST_F(RelayServerTest, BasicAuthGuardsTransfers)
{
	ServerConfig config = base_config();
	config.auth_mode = AuthMode::BASIC;
	config.username = "alice";
	config.password = "wonderland";
	start(config);

	Client::Response anonymous = client().upload("secret.bin", "data");
	EXPECT_EQ(anonymous.status, 401);
	EXPECT_EQ(anonymous.headers["www-authenticate"], "Basic realm=\"beam\"");

	Client::Response wrong = client({"alice", "rabbit", ""}).upload("secret.bin", "data");
	EXPECT_EQ(wrong.status, 401);

	Client::Response stranger = client({"bob", "wonderland", ""}).upload("secret.bin", "data");
	EXPECT_EQ(stranger.status, 401);

	EXPECT_EQ(registry().size(), 0u);

	Client::Credentials good{"alice", "wonderland", ""};
	auto upload = std::async(std::launch::async, [&] {
		return client(good).upload("secret.bin", "top secret");
	});
	ASSERT_TRUE(wait_for_stream("secret.bin"));

	StringSink sink;
	EXPECT_EQ(client().download("secret.bin", sink).status, 401);
	EXPECT_EQ(client(good).download("secret.bin", sink).status, 200);
	EXPECT_EQ(upload.get().status, 200);
	EXPECT_EQ(sink.str(), "top secret");
}

TEST_F(RelayServerTest, TokenModeBindsTransfersToTheirToken)
{
	ServerConfig config = base_config();
	config.auth_mode = AuthMode::TOKEN;
	start(config);

	std::string owner = client().issue_token();
	std::string other = client().issue_token();
	EXPECT_NE(owner, other);

	Client::Response anonymous = client().upload("bound.bin", "data");
	EXPECT_EQ(anonymous.status, 401);
	EXPECT_EQ(anonymous.headers["www-authenticate"], "Bearer realm=\"beam\"");

	EXPECT_EQ(client({"", "", "deadbeef"}).upload("bound.bin", "data").status, 401);

	auto upload = std::async(std::launch::async, [&] {
		return client({"", "", owner}).upload("bound.bin", "owned bytes");
	});
	ASSERT_TRUE(wait_for_stream("bound.bin"));
	EXPECT_EQ(server->service()->ledger().info(owner)->active_streams, 1u);

	// a foreign token does not consume the pending transfer
	StringSink sink;
	EXPECT_EQ(client({"", "", other}).download("bound.bin", sink).status, 403);
	EXPECT_TRUE(wait_for_stream("bound.bin"));

	EXPECT_EQ(client({"", "", owner}).download("bound.bin", sink).status, 200);
	EXPECT_EQ(upload.get().status, 200);
	EXPECT_EQ(sink.str(), "owned bytes");
	EXPECT_EQ(server->service()->ledger().info(owner)->active_streams, 0u);

	Client::Response list = client().get("/api/streams");
	EXPECT_EQ(nlohmann::json::parse(list.body)["live_tokens"], 2);
}

TEST_F(RelayServerTest, TokenAcceptedAsQueryParameter)
{
	ServerConfig config = base_config();
	config.auth_mode = AuthMode::TOKEN;
	start(config);

	std::string token = client().issue_token();

	auto upload = std::async(std::launch::async, [&] {
		return client({"", "", token}).upload("q.bin", "via query");
	});
	ASSERT_TRUE(wait_for_stream("q.bin"));

	Client::Response response = client().get("/q.bin?token=" + token);
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body, "via query");
	EXPECT_EQ(upload.get().status, 200);
}

TEST_F(RelayServerTest, TokenEndpointOnlyInTokenMode)
{
	start(base_config());
	EXPECT_THROW(client().issue_token(), std::runtime_error);
}

TEST_F(RelayServerTest, TruncatedUploadFailsBothSides)
{
	start(base_config());

	int uploader = raw_connect();
	SocketStreamWriter out(uploader);
	out.write(std::string("PUT /cut.bin HTTP/1.1\r\nContent-Length: 100000\r\n\r\n"));
	out.write(make_payload(20000));

	ASSERT_TRUE(wait_for_stream("cut.bin"));

	auto download = std::async(std::launch::async, [&] {
		StringSink sink;
		try {
			client().download("cut.bin", sink);
		}
		catch (const StreamReadError&) {
			return sink.str().size();
		}
		return static_cast<size_t>(0);
	});

	ASSERT_TRUE(wait_until([&] { return registry().size() == 0; }));
	shutdown(uploader, SHUT_WR);

	SocketReader reader(uploader);
	HttpResponseHead head = parse_response(reader.read_head());
	EXPECT_EQ(head.status, 400);

	EXPECT_EQ(download.get(), 20000u);
	close(uploader);
}

TEST_F(RelayServerTest, ExpectContinueWaitsForThePair)
{
	start(base_config());

	int uploader = raw_connect();
	SocketStreamWriter out(uploader);
	out.write(std::string("PUT /slow.bin HTTP/1.1\r\nContent-Length: 5\r\nExpect: 100-continue\r\n\r\n"));

	ASSERT_TRUE(wait_for_stream("slow.bin"));

	auto download = std::async(std::launch::async, [&] {
		StringSink sink;
		client().download("slow.bin", sink);
		return sink.str();
	});

	SocketReader reader(uploader);
	HttpResponseHead interim = parse_response(reader.read_head());
	EXPECT_EQ(interim.status, 100);

	out.write(std::string("hello"));

	HttpResponseHead final_head = parse_response(reader.read_head());
	EXPECT_EQ(final_head.status, 200);
	EXPECT_EQ(download.get(), "hello");
	close(uploader);
}

TEST_F(RelayServerTest, MalformedRequestIsBadRequest)
{
	start(base_config());

	int sock = raw_connect();
	SocketStreamWriter(sock).write(std::string("NONSENSE\r\n\r\n"));

	SocketReader reader(sock);
	EXPECT_EQ(parse_response(reader.read_head()).status, 400);
	close(sock);
}
