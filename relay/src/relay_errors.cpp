#include "relay_errors.hpp"

int RelayError::http_status() const
{
	switch (error_kind) {
		case Kind::BAD_REQUEST: return 400;
		case Kind::UNAUTHORIZED: return 401;
		case Kind::FORBIDDEN: return 403;
		case Kind::NOT_FOUND: return 404;
		case Kind::CONFLICT: return 409;
		case Kind::TIMEOUT: return 408;
		case Kind::UPSTREAM_READ: return 400;
		case Kind::INTERNAL: return 500;
	}
	return 500;
}
