#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "client.hpp"
#include "relay_coordinator.hpp"
#include "relay_errors.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using test_support::wait_until;

class RelayCoordinatorTest : public ::testing::Test
{
	protected:
		StreamRegistry registry;
		std::shared_ptr<Logger> logger = test_support::quiet_logger();

		RelayCoordinator::Options options(std::chrono::milliseconds timeout = 5000ms)
		{
			RelayCoordinator::Options opts;
			opts.pair_timeout = timeout;
			return opts;
		}

		std::shared_ptr<RelaySession> pair_as_downloader(const std::string& file_id)
		{
			auto session = registry.claim(file_id, RelayRole::DOWNLOADER, "");
			EXPECT_TRUE(session->ready.set(RelaySession::Clock::now()));
			return session;
		}
};

TEST_F(RelayCoordinatorTest, RelaysAllBytesInOrder)
{
	std::string payload = test_support::make_payload(100 * 1024);

	auto session = std::make_shared<RelaySession>("data.bin", RelayRole::UPLOADER, "");
	registry.register_session(session);

	std::atomic<uint64_t> progress{0};
	auto opts = options();
	opts.on_progress = [&progress](uint64_t bytes) { progress = bytes; };

	RelayCoordinator coordinator(registry, *logger, opts);
	coordinator.start(session, std::make_unique<test_support::SlicedSource>(payload, 3000));

	auto paired = pair_as_downloader("data.bin");

	StringSink sink;
	uint64_t delivered = RelayCoordinator::deliver(*paired, sink);

	auto outcome = session->outcome.wait();
	coordinator.join();

	ASSERT_TRUE(outcome.has_value());
	EXPECT_TRUE(outcome->ok());
	EXPECT_FALSE(outcome->partial);
	EXPECT_EQ(outcome->bytes, payload.size());
	EXPECT_EQ(delivered, payload.size());
	EXPECT_EQ(sink.str(), payload);
	EXPECT_EQ(progress.load(), payload.size());
	EXPECT_EQ(session->state(), RelayState::COMPLETE);
}

TEST_F(RelayCoordinatorTest, EmptyUploadCompletes)
{
	auto session = std::make_shared<RelaySession>("empty", RelayRole::UPLOADER, "");
	registry.register_session(session);

	RelayCoordinator coordinator(registry, *logger, options());
	coordinator.start(session, std::make_unique<StringSource>(""));

	auto paired = pair_as_downloader("empty");

	StringSink sink;
	EXPECT_EQ(RelayCoordinator::deliver(*paired, sink), 0u);

	auto outcome = session->outcome.wait();
	ASSERT_TRUE(outcome.has_value());
	EXPECT_TRUE(outcome->ok());
	EXPECT_EQ(outcome->bytes, 0u);
}

TEST_F(RelayCoordinatorTest, PairTimeoutFreesTheFileId)
{
	auto session = std::make_shared<RelaySession>("lonely", RelayRole::UPLOADER, "");
	registry.register_session(session);

	RelayCoordinator coordinator(registry, *logger, options(50ms));
	coordinator.start(session, std::make_unique<StringSource>("never sent"));

	auto outcome = session->outcome.wait();
	coordinator.join();

	ASSERT_TRUE(outcome.has_value());
	EXPECT_EQ(outcome->status, TransferOutcome::Status::TIMEOUT);
	EXPECT_EQ(session->state(), RelayState::FAILED);
	EXPECT_EQ(registry.size(), 0u);

	EXPECT_NO_THROW(registry.register_session(std::make_shared<RelaySession>("lonely", RelayRole::UPLOADER, "")));
}

TEST_F(RelayCoordinatorTest, AbandonedReadySignalEndsUnpaired)
{
	auto session = std::make_shared<RelaySession>("dropped", RelayRole::UPLOADER, "");
	registry.register_session(session);
	ASSERT_TRUE(session->ready.abandon());

	RelayCoordinator coordinator(registry, *logger, options());
	coordinator.start(session, std::make_unique<StringSource>("never sent"));

	auto outcome = session->outcome.wait();
	coordinator.join();

	ASSERT_TRUE(outcome.has_value());
	EXPECT_EQ(outcome->status, TransferOutcome::Status::UNPAIRED);
	EXPECT_EQ(session->state(), RelayState::FAILED);

	// sender closed exactly once, no error marker behind it
	EXPECT_FALSE(session->channel().receive().has_value());
}

TEST_F(RelayCoordinatorTest, ReadErrorReachesTheDownloader)
{
	auto session = std::make_shared<RelaySession>("broken", RelayRole::UPLOADER, "");
	registry.register_session(session);

	RelayCoordinator coordinator(registry, *logger, options());
	coordinator.start(session, std::make_unique<test_support::FailingSource>(40000));

	auto paired = pair_as_downloader("broken");

	StringSink sink;
	EXPECT_THROW(RelayCoordinator::deliver(*paired, sink), UpstreamReadError);
	EXPECT_EQ(sink.str().size(), 40000u);

	auto outcome = session->outcome.wait();
	coordinator.join();

	ASSERT_TRUE(outcome.has_value());
	EXPECT_EQ(outcome->status, TransferOutcome::Status::READ_ERROR);
	EXPECT_EQ(outcome->bytes, 40000u);
	EXPECT_EQ(session->state(), RelayState::FAILED);
}

TEST_F(RelayCoordinatorTest, DownloaderLeavingEndsUploadAsPartial)
{
	auto session = std::make_shared<RelaySession>("stream", RelayRole::UPLOADER, "");
	registry.register_session(session);

	RelayCoordinator coordinator(registry, *logger, options());
	coordinator.start(session, std::make_unique<test_support::EndlessSource>());

	auto paired = pair_as_downloader("stream");
	ASSERT_TRUE(paired->channel().receive().has_value());
	paired->channel().close_receiver();

	auto outcome = session->outcome.wait_for(5s);
	coordinator.join();

	ASSERT_TRUE(outcome.has_value());
	EXPECT_TRUE(outcome->ok());
	EXPECT_TRUE(outcome->partial);
	EXPECT_EQ(session->state(), RelayState::COMPLETE);
}

TEST_F(RelayCoordinatorTest, SlowDownloaderThrottlesTheUpload)
{
	const size_t capacity = 2;
	auto session = std::make_shared<RelaySession>("slow", RelayRole::UPLOADER, "", capacity);
	registry.register_session(session);

	auto source = std::make_unique<test_support::EndlessSource>();
	test_support::EndlessSource* counter = source.get();

	RelayCoordinator coordinator(registry, *logger, options());
	coordinator.start(session, std::move(source));

	auto paired = pair_as_downloader("slow");

	// queue full plus the chunk blocked in send()
	EXPECT_TRUE(wait_until([&] { return counter->reads.load() >= capacity + 1; }));
	std::this_thread::sleep_for(50ms);
	EXPECT_EQ(counter->reads.load(), capacity + 1);
	EXPECT_LE(paired->channel().size(), capacity);

	paired->channel().close_receiver();
	EXPECT_TRUE(session->outcome.wait_for(5s).has_value());
}

TEST_F(RelayCoordinatorTest, AwaitPairReportsAbandonedSignal)
{
	auto session = std::make_shared<RelaySession>("gone", RelayRole::DOWNLOADER, "");
	registry.register_session(session);
	session->ready.abandon();

	EXPECT_EQ(RelayCoordinator::await_pair(registry, session, 10ms), RelayCoordinator::PairResult::DROPPED);
}

TEST_F(RelayCoordinatorTest, AwaitPairHonoursClaimRacingTheDeadline)
{
	auto session = std::make_shared<RelaySession>("race", RelayRole::DOWNLOADER, "");
	registry.register_session(session);

	// claimed just before the deadline but signalled after it
	auto claimed = registry.claim("race", RelayRole::UPLOADER, "");
	std::thread claimant([claimed] {
		std::this_thread::sleep_for(100ms);
		claimed->ready.set(RelaySession::Clock::now());
	});

	EXPECT_EQ(RelayCoordinator::await_pair(registry, session, 20ms), RelayCoordinator::PairResult::PAIRED);
	claimant.join();
}

TEST_F(RelayCoordinatorTest, AwaitPairTimesOutAndRemovesEntry)
{
	auto session = std::make_shared<RelaySession>("idle", RelayRole::DOWNLOADER, "");
	registry.register_session(session);

	EXPECT_EQ(RelayCoordinator::await_pair(registry, session, 20ms), RelayCoordinator::PairResult::TIMED_OUT);
	EXPECT_EQ(registry.size(), 0u);
}
