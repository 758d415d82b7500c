#include "Errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace http_notifier {

std::string_view toString(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::TransientServerError: return "TransientServerError";
		case ErrorKind::RateLimited: return "RateLimited";
		case ErrorKind::ClientRejected: return "ClientRejected";
		case ErrorKind::RetriesExhausted: return "RetriesExhausted";
		case ErrorKind::TransportError: return "TransportError";
		case ErrorKind::Cancelled: return "Cancelled";
	}
	return "Unknown";
}

ErrorKind toErrorKind(FailureKind kind) {
	switch (kind) {
		case FailureKind::TransientServerError: return ErrorKind::TransientServerError;
		case FailureKind::RateLimited: return ErrorKind::RateLimited;
		case FailureKind::ClientRejected: return ErrorKind::ClientRejected;
		case FailureKind::TransportError: return ErrorKind::TransportError;
	}
	return ErrorKind::ClientRejected;
}

RetryError::RetryError(ErrorKind kind, std::string reason, std::vector<Attempt> attempts,
					   std::optional<FailureKind> lastFailure)
	: std::runtime_error(fmt::format("{}: {} (after {} attempt{})", toString(kind), reason,
									 attempts.size(), attempts.size() == 1 ? "" : "s")),
	  kind_(kind), lastFailure_(lastFailure), reason_(std::move(reason)), attempts_(std::move(attempts)) {}

} // namespace http_notifier
