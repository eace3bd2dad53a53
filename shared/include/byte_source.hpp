#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#pragma once

// raised by a ByteSource whose underlying connection failed mid-stream
class StreamReadError : public std::runtime_error
{
	public:
		explicit StreamReadError(const std::string& what)
			: std::runtime_error(what) {}
};

class ByteSource
{
	public:
		virtual ~ByteSource() = default;

		// returns 0 at end of stream, throws StreamReadError on failure
		virtual size_t read(uint8_t* buf, size_t cap) = 0;
};
