#include <stdexcept>
#include <string>

#pragma once

class RelayError : public std::runtime_error
{
	public:
		enum class Kind {
			BAD_REQUEST,
			UNAUTHORIZED,
			FORBIDDEN,
			NOT_FOUND,
			CONFLICT,
			TIMEOUT,
			UPSTREAM_READ,
			INTERNAL
		};

		RelayError(Kind kind, const std::string& what)
			: std::runtime_error(what), error_kind(kind) {}

		Kind kind() const { return error_kind; }
		int http_status() const;

	private:
		Kind error_kind;
};

class BadRequestError : public RelayError
{
	public:
		explicit BadRequestError(const std::string& what)
			: RelayError(Kind::BAD_REQUEST, what) {}
};

class UnauthorizedError : public RelayError
{
	public:
		explicit UnauthorizedError(const std::string& what)
			: RelayError(Kind::UNAUTHORIZED, what) {}
};

class ForbiddenError : public RelayError
{
	public:
		explicit ForbiddenError(const std::string& what)
			: RelayError(Kind::FORBIDDEN, what) {}
};

class NotFoundError : public RelayError
{
	public:
		explicit NotFoundError(const std::string& what)
			: RelayError(Kind::NOT_FOUND, what) {}
};

class ConflictError : public RelayError
{
	public:
		explicit ConflictError(const std::string& what)
			: RelayError(Kind::CONFLICT, what) {}
};

class TimeoutError : public RelayError
{
	public:
		explicit TimeoutError(const std::string& what)
			: RelayError(Kind::TIMEOUT, what) {}
};

class UpstreamReadError : public RelayError
{
	public:
		explicit UpstreamReadError(const std::string& what)
			: RelayError(Kind::UPSTREAM_READ, what) {}
};

class InternalError : public RelayError
{
	public:
		explicit InternalError(const std::string& what)
			: RelayError(Kind::INTERNAL, what) {}
};
