#include "byte_channel.hpp"

#include <stdexcept>

ByteChannel::ByteChannel(size_t capacity)
	: max_slots(capacity)
{
	if (capacity == 0) {
		throw std::invalid_argument("ByteChannel capacity must be at least 1");
	}
}

ByteChannel::SendStatus ByteChannel::send(RelayChunk chunk)
{
	std::unique_lock<std::mutex> lock(mutex);

	if (sender_done) {
		throw std::logic_error("send() after close_sender()");
	}

	not_full.wait(lock, [this] { return receiver_done || queue.size() < max_slots; });

	if (receiver_done) return SendStatus::RECEIVER_GONE;

	queue.push_back(std::move(chunk));
	lock.unlock();

	not_empty.notify_one();
	return SendStatus::OK;
}

std::optional<RelayChunk> ByteChannel::receive()
{
	std::unique_lock<std::mutex> lock(mutex);
	not_empty.wait(lock, [this] { return !queue.empty() || sender_done || receiver_done; });

	if (queue.empty() || receiver_done) return std::nullopt;

	RelayChunk chunk = std::move(queue.front());
	queue.pop_front();
	lock.unlock();

	not_full.notify_one();
	return chunk;
}

void ByteChannel::close_sender()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		sender_done = true;
	}
	not_empty.notify_all();
}

void ByteChannel::close_receiver()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		receiver_done = true;
		queue.clear();
	}
	not_full.notify_all();
	not_empty.notify_all();
}

bool ByteChannel::receiver_closed() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return receiver_done;
}

size_t ByteChannel::size() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return queue.size();
}
