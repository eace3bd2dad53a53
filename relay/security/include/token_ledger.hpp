#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "logger.hpp"

#pragma once

struct TokenPolicy {
	std::chrono::seconds lifetime{20 * 60};
	std::chrono::seconds extension{5 * 60};
};

/*
*	Live capability tokens. A token lives `lifetime` from issue and every
*	validated use pushes its expiry out to at least now + `extension`, so a
*	token in steady use never lapses while an idle one does. Expiry never
*	moves backwards. Expired entries are invisible to every caller even
*	before sweep() evicts them.
*/
class TokenLedger
{
	public:
		using Clock = std::chrono::steady_clock;
		using TimePoint = Clock::time_point;
		using TimeSource = std::function<TimePoint()>;

		struct TokenInfo {
			TimePoint created_at;
			TimePoint expires_at;
			uint64_t active_streams = 0;
		};

		explicit TokenLedger(TokenPolicy policy = TokenPolicy(), TimeSource now = &Clock::now);

		TokenLedger(const TokenLedger&) = delete;
		TokenLedger& operator=(const TokenLedger&) = delete;

		std::string issue();

		// check and extension happen under one lock
		bool validate_and_extend(const std::string& token);

		// extension only, for a transfer that already authenticated; no-op if gone
		void touch(const std::string& token);

		// best effort, never drops below zero, no-op for an unknown token
		void adjust_active_count(const std::string& token, int64_t delta);

		size_t sweep();
		size_t sweep(TimePoint now);

		std::optional<TokenInfo> info(const std::string& token) const;
		size_t live_count() const;

		const TokenPolicy& policy() const { return token_policy; }

	private:
		TokenPolicy token_policy;
		TimeSource clock;

		mutable std::mutex mutex;
		std::unordered_map<std::string, TokenInfo> tokens;

		// caller holds the lock
		TokenInfo* find_live(const std::string& token, TimePoint now);
};

// Periodic TokenLedger::sweep() on a background thread.
class TokenSweeper
{
	public:
		TokenSweeper(TokenLedger& ledger, Logger& logger, std::chrono::milliseconds interval);
		~TokenSweeper();

		TokenSweeper(const TokenSweeper&) = delete;
		TokenSweeper& operator=(const TokenSweeper&) = delete;

		void stop();

	private:
		TokenLedger& ledger;
		Logger& logger;
		std::chrono::milliseconds interval;

		std::mutex mutex;
		std::condition_variable cv;
		bool stopping = false;

		std::thread worker;

		void run();
};
