#pragma once

#include "Outcome.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace http_notifier {

enum class ErrorKind : uint8_t {
	TransientServerError,
	RateLimited,
	ClientRejected,
	RetriesExhausted,
	TransportError,
	Cancelled
};

std::string_view toString(ErrorKind kind);
ErrorKind toErrorKind(FailureKind kind);

/**
 * Terminal failure of a retry run.
 * Carries the last reason and the full attempt sequence.
 */
class RetryError : public std::runtime_error {
public:
	RetryError(ErrorKind kind, std::string reason, std::vector<Attempt> attempts,
			   std::optional<FailureKind> lastFailure = std::nullopt);

	ErrorKind kind() const { return kind_; }
	// Kind of the last failed attempt, nullopt if none was made
	std::optional<FailureKind> lastFailure() const { return lastFailure_; }
	const std::string& reason() const { return reason_; }
	const std::vector<Attempt>& attempts() const { return attempts_; }
	uint32_t attemptCount() const { return static_cast<uint32_t>(attempts_.size()); }

private:
	ErrorKind kind_;
	std::optional<FailureKind> lastFailure_;
	std::string reason_;
	std::vector<Attempt> attempts_;
};

class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace http_notifier
