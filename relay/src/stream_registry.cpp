#include "stream_registry.hpp"

#include <algorithm>

void StreamRegistry::register_session(const std::shared_ptr<RelaySession>& session)
{
	std::lock_guard<std::mutex> lock(mutex);

	if (streams.count(session->file_id()) != 0) {
		throw ConflictError("A transfer is already in progress for " + session->file_id());
	}

	streams.emplace(session->file_id(), session);
}

std::shared_ptr<RelaySession> StreamRegistry::take_locked(const std::string& file_id, RelayRole claimant, const std::string& token)
{
	auto it = streams.find(file_id);
	if (it == streams.end()) {
		throw NotFoundError("No active transfer for " + file_id);
	}

	const std::shared_ptr<RelaySession>& pending = it->second;

	if (pending->initiator() == claimant) {
		throw ConflictError(std::string("A ") + role_to_string(claimant) + " is already waiting for " + file_id);
	}

	if (pending->owner_token() != token) {
		throw ForbiddenError("Token does not own the transfer " + file_id);
	}

	std::shared_ptr<RelaySession> session = pending;
	streams.erase(it);
	return session;
}

std::shared_ptr<RelaySession> StreamRegistry::claim(const std::string& file_id, RelayRole claimant, const std::string& token)
{
	std::shared_ptr<RelaySession> session;
	{
		std::lock_guard<std::mutex> lock(mutex);
		session = take_locked(file_id, claimant, token);
	}

	session->release();
	return session;
}

StreamRegistry::Rendezvous StreamRegistry::rendezvous(const std::shared_ptr<RelaySession>& candidate)
{
	std::shared_ptr<RelaySession> session;
	{
		std::lock_guard<std::mutex> lock(mutex);

		if (streams.count(candidate->file_id()) == 0) {
			streams.emplace(candidate->file_id(), candidate);
			return Rendezvous{candidate, false};
		}

		session = take_locked(candidate->file_id(), candidate->initiator(), candidate->owner_token());
	}

	session->release();
	return Rendezvous{session, true};
}

bool StreamRegistry::remove(const std::shared_ptr<RelaySession>& session)
{
	{
		std::lock_guard<std::mutex> lock(mutex);

		auto it = streams.find(session->file_id());
		if (it == streams.end() || it->second != session) {
			return false;
		}

		streams.erase(it);
	}

	session->release();
	return true;
}

std::vector<std::string> StreamRegistry::list_active() const
{
	std::vector<std::string> ids;
	{
		std::lock_guard<std::mutex> lock(mutex);
		ids.reserve(streams.size());
		for (const auto& entry : streams) {
			ids.push_back(entry.first);
		}
	}

	std::sort(ids.begin(), ids.end());
	return ids;
}

std::vector<StreamRegistry::ActiveStream> StreamRegistry::snapshot() const
{
	auto now = RelaySession::Clock::now();
	std::vector<ActiveStream> active;
	{
		std::lock_guard<std::mutex> lock(mutex);
		for (const auto& entry : streams) {
			active.push_back(ActiveStream{
				entry.first,
				entry.second->initiator(),
				std::chrono::duration_cast<std::chrono::seconds>(now - entry.second->created_at()),
				!entry.second->owner_token().empty()
			});
		}
	}

	std::sort(active.begin(), active.end(), [](const ActiveStream& a, const ActiveStream& b) {
		return a.file_id < b.file_id;
	});
	return active;
}

size_t StreamRegistry::size() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return streams.size();
}
