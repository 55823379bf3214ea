#pragma once

#include "statkit/core/errors.hpp"
#include <atomic>

namespace statkit {
namespace core {

/**
 * Cooperative cancellation flag
 *
 * Long-running algorithms (K-Means, PCA, correlation matrices) poll the token
 * once per outer iteration and throw core::Cancelled when it is set. The token
 * is owned by the caller and may be set from any thread.
 */
class CancellationToken {
public:
	CancellationToken() : cancelled_(false) {
	}

	CancellationToken(const CancellationToken &) = delete;
	CancellationToken &operator=(const CancellationToken &) = delete;

	void Cancel() noexcept {
		cancelled_.store(true, std::memory_order_relaxed);
	}

	bool IsCancelled() const noexcept {
		return cancelled_.load(std::memory_order_relaxed);
	}

	void ThrowIfCancelled(const char *where) const {
		if (IsCancelled()) {
			throw Cancelled(std::string("cancelled during ") + where);
		}
	}

private:
	std::atomic<bool> cancelled_;
};

/// Poll helper accepting an optional token
inline void CheckCancelled(const CancellationToken *token, const char *where) {
	if (token != nullptr) {
		token->ThrowIfCancelled(where);
	}
}

} // namespace core
} // namespace statkit
