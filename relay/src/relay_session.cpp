#include "relay_session.hpp"

const char* role_to_string(RelayRole role)
{
	switch (role) {
		case RelayRole::UPLOADER: return "upload";
		case RelayRole::DOWNLOADER: return "download";
	}
	return "unknown";
}

const char* state_to_string(RelayState state)
{
	switch (state) {
		case RelayState::PENDING_PAIR: return "pending";
		case RelayState::STREAMING: return "streaming";
		case RelayState::COMPLETE: return "complete";
		case RelayState::FAILED: return "failed";
	}
	return "unknown";
}

RelaySession::RelaySession(const std::string& file_id, RelayRole initiator, const std::string& owner_token,
		size_t channel_capacity)
	: id(file_id),
	  initiating_role(initiator),
	  token(owner_token),
	  created(Clock::now()),
	  byte_channel(channel_capacity)
{
}

void RelaySession::release()
{
	if (released.exchange(true)) return;

	if (release_hook) {
		release_hook();
	}
}
