#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "byte_channel.hpp"
#include "one_shot.hpp"

#pragma once

enum class RelayRole {
	UPLOADER,
	DOWNLOADER
};

enum class RelayState {
	PENDING_PAIR,
	STREAMING,
	COMPLETE,
	FAILED
};

const char* role_to_string(RelayRole role);
const char* state_to_string(RelayState state);

struct TransferOutcome
{
	enum class Status {
		SUCCESS,
		TIMEOUT,
		// the ready signal was abandoned without a pairing
		UNPAIRED,
		READ_ERROR,
		INTERNAL
	};

	Status status = Status::SUCCESS;
	std::string reason;
	uint64_t bytes = 0;

	// the downloader went away before end of input
	bool partial = false;

	bool ok() const { return status == Status::SUCCESS; }

	static TransferOutcome success(uint64_t bytes, bool partial)
	{
		TransferOutcome outcome;
		outcome.bytes = bytes;
		outcome.partial = partial;
		return outcome;
	}

	static TransferOutcome failure(Status status, const std::string& reason, uint64_t bytes = 0)
	{
		TransferOutcome outcome;
		outcome.status = status;
		outcome.reason = reason;
		outcome.bytes = bytes;
		return outcome;
	}
};

/*
*	One upload paired with one download. Lives in the StreamRegistry until the
*	second party claims it (or the pairing wait times out), after which the two
*	connection handlers share it through shared_ptr for the rest of the relay.
*/
class RelaySession
{
	public:
		using Clock = std::chrono::steady_clock;

		RelaySession(const std::string& file_id, RelayRole initiator, const std::string& owner_token,
				size_t channel_capacity = ByteChannel::DEFAULT_CAPACITY);

		RelaySession(const RelaySession&) = delete;
		RelaySession& operator=(const RelaySession&) = delete;

		const std::string& file_id() const { return id; }
		RelayRole initiator() const { return initiating_role; }
		const std::string& owner_token() const { return token; }
		Clock::time_point created_at() const { return created; }

		ByteChannel& channel() { return byte_channel; }

		// fired by the claimant with the claim time
		OneShot<Clock::time_point> ready;

		// fired by the relay pump on its terminal transition
		OneShot<TransferOutcome> outcome;

		RelayState state() const { return relay_state.load(); }
		void set_state(RelayState s) { relay_state.store(s); }

		void add_bytes(uint64_t n) { relayed += n; }
		uint64_t bytes_relayed() const { return relayed.load(); }

		// runs when the session leaves the registry; must be set before it is inserted
		void set_release_hook(std::function<void()> hook) { release_hook = std::move(hook); }

		// at most once, whoever gets here first
		void release();

	private:
		std::string id;
		RelayRole initiating_role;
		std::string token;
		Clock::time_point created;

		ByteChannel byte_channel;

		std::atomic<RelayState> relay_state{RelayState::PENDING_PAIR};
		std::atomic<uint64_t> relayed{0};
		std::atomic<bool> released{false};
		std::function<void()> release_hook;
};
