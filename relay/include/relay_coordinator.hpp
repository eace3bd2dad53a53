#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "byte_source.hpp"
#include "logger.hpp"
#include "relay_session.hpp"
#include "stream_registry.hpp"
#include "stream_writer.hpp"

#pragma once

/*
*	Drives one session from the upload side:
*
*	PENDING_PAIR -> claimed           -> STREAMING -> EOF -> COMPLETE
*	PENDING_PAIR -> pairing timeout   -> FAILED
*	STREAMING    -> read error        -> FAILED (error marker sent in-band)
*	STREAMING    -> downloader gone   -> COMPLETE (partial)
*
*	start() runs the pump on its own thread; the terminal transition is
*	published through the session's outcome signal.
*/
class RelayCoordinator
{
	public:
		constexpr static size_t CHUNK_SIZE = 16 * 1024;

		// how long a timed-out waiter gives a claimant that beat it to the registry
		constexpr static std::chrono::seconds CLAIM_GRACE{5};

		enum class PairResult {
			PAIRED,
			TIMED_OUT,
			DROPPED
		};

		struct Options {
			std::chrono::milliseconds pair_timeout{std::chrono::seconds(300)};

			// called after every forwarded chunk
			std::function<void(uint64_t bytes_so_far)> on_progress;
		};

		RelayCoordinator(StreamRegistry& registry, Logger& logger, Options options);
		~RelayCoordinator();

		RelayCoordinator(const RelayCoordinator&) = delete;
		RelayCoordinator& operator=(const RelayCoordinator&) = delete;

		void start(std::shared_ptr<RelaySession> session, std::unique_ptr<ByteSource> source);
		void join();

		// blocks on the session's ready signal; on timeout the waiter removes its own entry
		static PairResult await_pair(StreamRegistry& registry, const std::shared_ptr<RelaySession>& session,
				std::chrono::milliseconds timeout);

		// download side: channel -> writer. Throws UpstreamReadError when the
		// pump forwarded a read failure. Returns bytes written.
		static uint64_t deliver(RelaySession& session, StreamWriter& writer);

	private:
		StreamRegistry& registry;
		Logger& logger;
		Options options;

		std::thread worker;

		void pump(std::shared_ptr<RelaySession> session, std::unique_ptr<ByteSource> source);
		void finish(RelaySession& session, RelayState state, const TransferOutcome& outcome);
};
