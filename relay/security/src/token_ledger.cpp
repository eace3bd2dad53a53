#include "token_ledger.hpp"

#include <algorithm>

#include "crypto.hpp"

TokenLedger::TokenLedger(TokenPolicy policy, TimeSource now)
	: token_policy(policy), clock(std::move(now))
{
	Crypto::init();
}

TokenLedger::TokenInfo* TokenLedger::find_live(const std::string& token, TimePoint now)
{
	auto it = tokens.find(token);
	if (it == tokens.end()) return nullptr;
	if (it->second.expires_at <= now) return nullptr;
	return &it->second;
}

std::string TokenLedger::issue()
{
	TimePoint now = clock();

	std::lock_guard<std::mutex> lock(mutex);

	std::string token;
	do {
		token = Crypto::random_token();
	} while (tokens.count(token) != 0);

	TokenInfo info;
	info.created_at = now;
	info.expires_at = now + token_policy.lifetime;
	tokens.emplace(token, info);

	return token;
}

bool TokenLedger::validate_and_extend(const std::string& token)
{
	if (token.empty()) return false;

	TimePoint now = clock();

	std::lock_guard<std::mutex> lock(mutex);

	TokenInfo* info = find_live(token, now);
	if (!info) return false;

	info->expires_at = std::max(info->expires_at, now + token_policy.extension);
	return true;
}

void TokenLedger::touch(const std::string& token)
{
	TimePoint now = clock();

	std::lock_guard<std::mutex> lock(mutex);

	TokenInfo* info = find_live(token, now);
	if (!info) return;

	info->expires_at = std::max(info->expires_at, now + token_policy.extension);
}

void TokenLedger::adjust_active_count(const std::string& token, int64_t delta)
{
	std::lock_guard<std::mutex> lock(mutex);

	auto it = tokens.find(token);
	if (it == tokens.end()) return;

	uint64_t& count = it->second.active_streams;
	if (delta < 0 && static_cast<uint64_t>(-delta) > count) {
		count = 0;
	}
	else {
		count = static_cast<uint64_t>(static_cast<int64_t>(count) + delta);
	}
}

size_t TokenLedger::sweep()
{
	return sweep(clock());
}

size_t TokenLedger::sweep(TimePoint now)
{
	std::lock_guard<std::mutex> lock(mutex);

	size_t removed = 0;
	for (auto it = tokens.begin(); it != tokens.end(); ) {
		if (it->second.expires_at <= now) {
			it = tokens.erase(it);
			removed++;
		}
		else {
			++it;
		}
	}

	return removed;
}

std::optional<TokenLedger::TokenInfo> TokenLedger::info(const std::string& token) const
{
	TimePoint now = clock();

	std::lock_guard<std::mutex> lock(mutex);

	auto it = tokens.find(token);
	if (it == tokens.end() || it->second.expires_at <= now) {
		return std::nullopt;
	}

	return it->second;
}

size_t TokenLedger::live_count() const
{
	TimePoint now = clock();

	std::lock_guard<std::mutex> lock(mutex);

	return static_cast<size_t>(std::count_if(tokens.begin(), tokens.end(), [now](const auto& entry) {
		return entry.second.expires_at > now;
	}));
}

TokenSweeper::TokenSweeper(TokenLedger& ledger, Logger& logger, std::chrono::milliseconds interval)
	: ledger(ledger), logger(logger), interval(interval)
{
	worker = std::thread(&TokenSweeper::run, this);
}

TokenSweeper::~TokenSweeper()
{
	stop();
}

void TokenSweeper::stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		stopping = true;
	}
	cv.notify_all();

	if (worker.joinable()) {
		worker.join();
	}
}

void TokenSweeper::run()
{
	std::unique_lock<std::mutex> lock(mutex);

	while (!stopping) {
		if (cv.wait_for(lock, interval, [this] { return stopping; })) {
			break;
		}

		lock.unlock();

		size_t removed = ledger.sweep();
		if (removed > 0) {
			logger.log_event(Logger::LogEvent::TOKEN_SWEEP, {
				{"evicted", static_cast<uint64_t>(removed)},
				{"live", static_cast<uint64_t>(ledger.live_count())}
			});
		}

		lock.lock();
	}
}
