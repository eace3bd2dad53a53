#include "relay_coordinator.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

#include "relay_errors.hpp"

RelayCoordinator::RelayCoordinator(StreamRegistry& registry, Logger& logger, Options options)
	: registry(registry), logger(logger), options(std::move(options))
{
}

RelayCoordinator::~RelayCoordinator()
{
	join();
}

void RelayCoordinator::join()
{
	if (worker.joinable()) {
		worker.join();
	}
}

void RelayCoordinator::start(std::shared_ptr<RelaySession> session, std::unique_ptr<ByteSource> source)
{
	if (worker.joinable()) {
		throw std::logic_error("RelayCoordinator already started");
	}

	try {
		worker = std::thread(&RelayCoordinator::pump, this, session, std::move(source));
	}
	catch (const std::system_error& e) {
		logger.log_event(Logger::LogEvent::INTERNAL_ERROR, {
			{"file", session->file_id()},
			{"error", e.what()}
		});

		// nobody will pump this session, make sure neither side waits on it
		registry.remove(session);
		session->ready.abandon();
		session->channel().send(RelayChunk::error_marker("Relay task failed to start"));
		session->channel().close_sender();
		finish(*session, RelayState::FAILED,
			TransferOutcome::failure(TransferOutcome::Status::INTERNAL, "Relay task failed to start"));
	}
}

RelayCoordinator::PairResult RelayCoordinator::await_pair(StreamRegistry& registry, const std::shared_ptr<RelaySession>& session,
		std::chrono::milliseconds timeout)
{
	if (session->ready.wait_for(timeout)) {
		return PairResult::PAIRED;
	}

	if (session->ready.current_state() == OneShot<RelaySession::Clock::time_point>::State::ABANDONED) {
		return PairResult::DROPPED;
	}

	if (registry.remove(session)) {
		return PairResult::TIMED_OUT;
	}

	// a claimant took the entry right at the deadline and fires ready next
	if (session->ready.wait_for(CLAIM_GRACE)) {
		return PairResult::PAIRED;
	}

	// if abandon() loses the race, the claimant's signal just landed
	if (session->ready.abandon()) {
		return PairResult::TIMED_OUT;
	}

	return PairResult::PAIRED;
}

void RelayCoordinator::finish(RelaySession& session, RelayState state, const TransferOutcome& outcome)
{
	session.set_state(state);

	if (!session.outcome.set(outcome)) {
		logger.log_event(Logger::LogEvent::INTERNAL_ERROR, {
			{"file", session.file_id()},
			{"error", "transfer outcome already published"}
		});
	}
}

void RelayCoordinator::pump(std::shared_ptr<RelaySession> session, std::unique_ptr<ByteSource> source)
{
	const std::string& file_id = session->file_id();
	ByteChannel& channel = session->channel();
	bool sender_open = true;

	try {
		PairResult paired = await_pair(registry, session, options.pair_timeout);

		if (paired == PairResult::TIMED_OUT) {
			logger.log_event(Logger::LogEvent::PAIR_TIMEOUT, {
				{"file", file_id},
				{"side", role_to_string(RelayRole::UPLOADER)},
				{"timeout_ms", static_cast<int64_t>(options.pair_timeout.count())}
			});

			channel.close_sender();
			sender_open = false;
			finish(*session, RelayState::FAILED,
				TransferOutcome::failure(TransferOutcome::Status::TIMEOUT, "Timeout waiting for download client"));
			return;
		}

		if (paired == PairResult::DROPPED) {
			channel.close_sender();
			sender_open = false;
			finish(*session, RelayState::FAILED,
				TransferOutcome::failure(TransferOutcome::Status::UNPAIRED, "Ready signal dropped"));
			return;
		}

		session->set_state(RelayState::STREAMING);
		logger.log_event(Logger::LogEvent::UPLOAD_START, {{"file", file_id}});

		std::vector<uint8_t> buf(CHUNK_SIZE);
		bool consumer_gone = false;

		while (true) {
			size_t n = 0;

			try {
				n = source->read(buf.data(), buf.size());
			}
			catch (const StreamReadError& e) {
				logger.log_event(Logger::LogEvent::UPLOAD_FAILURE, {
					{"file", file_id},
					{"bytes", session->bytes_relayed()},
					{"error", e.what()}
				});

				// the downloader has to see a failed stream, not a short one
				if (channel.send(RelayChunk::error_marker(e.what())) == ByteChannel::SendStatus::RECEIVER_GONE) {
					logger.log_event(Logger::LogEvent::UPLOAD_ABORT, {
						{"file", file_id},
						{"reason", "download client already gone"}
					});
				}
				channel.close_sender();
				sender_open = false;

				finish(*session, RelayState::FAILED,
					TransferOutcome::failure(TransferOutcome::Status::READ_ERROR,
						std::string("Stream error: ") + e.what(), session->bytes_relayed()));
				return;
			}

			if (n == 0) break;

			if (channel.send(RelayChunk::bytes(buf.data(), n)) == ByteChannel::SendStatus::RECEIVER_GONE) {
				consumer_gone = true;
				logger.log_event(Logger::LogEvent::UPLOAD_ABORT, {
					{"file", file_id},
					{"bytes", session->bytes_relayed()},
					{"reason", "download client disconnected"}
				});
				break;
			}

			session->add_bytes(n);
			if (options.on_progress) {
				options.on_progress(session->bytes_relayed());
			}
		}

		channel.close_sender();
		sender_open = false;

		logger.log_event(Logger::LogEvent::UPLOAD_COMPLETE, {
			{"file", file_id},
			{"bytes", session->bytes_relayed()},
			{"partial", consumer_gone}
		});

		finish(*session, RelayState::COMPLETE, TransferOutcome::success(session->bytes_relayed(), consumer_gone));
	}
	catch (const std::exception& e) {
		logger.log_event(Logger::LogEvent::INTERNAL_ERROR, {
			{"file", file_id},
			{"error", e.what()}
		});

		if (sender_open) {
			if (channel.send(RelayChunk::error_marker(e.what())) == ByteChannel::SendStatus::OK) {
				logger.log_event(Logger::LogEvent::UPLOAD_ABORT, {
					{"file", file_id},
					{"reason", "relay task failed, download terminated"}
				});
			}
			channel.close_sender();
		}

		finish(*session, RelayState::FAILED,
			TransferOutcome::failure(TransferOutcome::Status::INTERNAL, e.what(), session->bytes_relayed()));
	}
}

uint64_t RelayCoordinator::deliver(RelaySession& session, StreamWriter& writer)
{
	// whatever way we leave, the pump must stop feeding us
	struct ReceiverGuard {
		ByteChannel& channel;
		~ReceiverGuard() { channel.close_receiver(); }
	} guard{session.channel()};

	uint64_t total = 0;

	while (std::optional<RelayChunk> chunk = session.channel().receive()) {
		if (chunk->failed) {
			throw UpstreamReadError(chunk->error);
		}

		writer.write(chunk->data.data(), chunk->data.size());
		total += chunk->data.size();
	}

	writer.flush();
	return total;
}
