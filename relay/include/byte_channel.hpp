#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#pragma once

struct RelayChunk
{
	std::vector<uint8_t> data;

	// in-band error marker, terminates the stream on the receiving side
	bool failed = false;
	std::string error;

	static RelayChunk bytes(const uint8_t* data, size_t len)
	{
		RelayChunk chunk;
		chunk.data.assign(data, data + len);
		return chunk;
	}

	static RelayChunk error_marker(const std::string& reason)
	{
		RelayChunk chunk;
		chunk.failed = true;
		chunk.error = reason;
		return chunk;
	}
};

/*
*	Fixed-capacity FIFO between the upload pump and the download writer.
*	send() blocks while the queue is full, which is what throttles the uploader
*	to the downloader's pace. Closing the receiving end wakes a blocked sender
*	and makes every later send() fail.
*/
class ByteChannel
{
	public:
		constexpr static size_t DEFAULT_CAPACITY = 16;

		enum class SendStatus {
			OK,
			RECEIVER_GONE
		};

		explicit ByteChannel(size_t capacity = DEFAULT_CAPACITY);

		ByteChannel(const ByteChannel&) = delete;
		ByteChannel& operator=(const ByteChannel&) = delete;

		SendStatus send(RelayChunk chunk);

		// nullopt once the sender closed and the queue drained
		std::optional<RelayChunk> receive();

		void close_sender();

		// drops anything still queued
		void close_receiver();

		bool receiver_closed() const;
		size_t size() const;
		size_t capacity() const { return max_slots; }

	private:
		mutable std::mutex mutex;
		std::condition_variable not_full;
		std::condition_variable not_empty;

		std::deque<RelayChunk> queue;
		const size_t max_slots;

		bool sender_done = false;
		bool receiver_done = false;
};
