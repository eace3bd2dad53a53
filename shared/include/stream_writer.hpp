#include <cstddef>
#include <cstdint>

#pragma once

// Byte sink for relayed data: sockets, chunked HTTP bodies, download files.
// write() throws std::runtime_error when the destination is gone.
class StreamWriter
{
	public:
		virtual ~StreamWriter() = default;
		virtual void write(const uint8_t* data, size_t len) = 0;
		virtual void flush() = 0;
};
