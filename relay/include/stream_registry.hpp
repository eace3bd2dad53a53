#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay_errors.hpp"
#include "relay_session.hpp"

#pragma once

/*
*	FileId -> pending RelaySession. Every operation is one short critical
*	section over the map; nothing here ever waits on a session's signals.
*
*	Entries leave the map exactly once: claim() and rendezvous() hand them to
*	the second party, remove() is the pairing-timeout cleanup and only takes
*	the entry if it is still the caller's own session.
*/
class StreamRegistry
{
	public:
		struct ActiveStream {
			std::string file_id;
			RelayRole waiting_side;
			std::chrono::seconds waiting_for;
			bool token_bound;
		};

		struct Rendezvous {
			std::shared_ptr<RelaySession> session;

			// true when the candidate paired with a waiting session instead of being inserted
			bool claimed;
		};

		StreamRegistry() = default;

		StreamRegistry(const StreamRegistry&) = delete;
		StreamRegistry& operator=(const StreamRegistry&) = delete;

		// throws ConflictError if the FileId is already pending
		void register_session(const std::shared_ptr<RelaySession>& session);

		// throws NotFoundError, ConflictError (same side already waiting) or
		// ForbiddenError (token mismatch, entry left in place)
		std::shared_ptr<RelaySession> claim(const std::string& file_id, RelayRole claimant, const std::string& token);

		// claim-or-register in one step, for either-order pairing
		Rendezvous rendezvous(const std::shared_ptr<RelaySession>& candidate);

		bool remove(const std::shared_ptr<RelaySession>& session);

		std::vector<std::string> list_active() const;
		std::vector<ActiveStream> snapshot() const;
		size_t size() const;

	private:
		mutable std::mutex mutex;
		std::unordered_map<std::string, std::shared_ptr<RelaySession>> streams;

		// caller holds the lock
		std::shared_ptr<RelaySession> take_locked(const std::string& file_id, RelayRole claimant, const std::string& token);
};
