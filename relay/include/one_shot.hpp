#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

#pragma once

/*
*	Single-fire hand-off between two threads. The first set() wins, later ones
*	are rejected. A waiter that shows up after the value was set returns
*	straight away. abandon() releases a waiter without a value, for the case
*	where the producer goes away without ever firing.
*/
template <typename T>
class OneShot
{
	public:
		enum class State {
			PENDING,
			SET,
			ABANDONED
		};

		OneShot() = default;

		OneShot(const OneShot&) = delete;
		OneShot& operator=(const OneShot&) = delete;

		bool set(T v)
		{
			{
				std::lock_guard<std::mutex> lock(mutex);
				if (state != State::PENDING) return false;
				value = std::move(v);
				state = State::SET;
			}

			cv.notify_all();
			return true;
		}

		bool abandon()
		{
			{
				std::lock_guard<std::mutex> lock(mutex);
				if (state != State::PENDING) return false;
				state = State::ABANDONED;
			}

			cv.notify_all();
			return true;
		}

		// nullopt only when abandoned
		std::optional<T> wait()
		{
			std::unique_lock<std::mutex> lock(mutex);
			cv.wait(lock, [this] { return state != State::PENDING; });
			return value;
		}

		// nullopt on timeout or abandonment, check current_state() to tell them apart
		template <typename Rep, typename Period>
		std::optional<T> wait_for(const std::chrono::duration<Rep, Period>& timeout)
		{
			std::unique_lock<std::mutex> lock(mutex);
			cv.wait_for(lock, timeout, [this] { return state != State::PENDING; });
			return value;
		}

		State current_state() const
		{
			std::lock_guard<std::mutex> lock(mutex);
			return state;
		}

	private:
		mutable std::mutex mutex;
		std::condition_variable cv;
		State state = State::PENDING;
		std::optional<T> value;
};
