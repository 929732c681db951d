//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryingInvoker.hpp
// Purpose: Retry-on-credential-rejection decorator applied uniformly to remote operations
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "logging/Logger.h"
#include "tokenkeeper/errors/Errors.h"

namespace tokenkeeper {

//==========================================================================================================
// RetryingInvoker
// Purpose: Runs a deferred remote operation. When it fails because the credential was rejected, runs one
//          synchronous refresh and retries, up to maxTryTimes executions in total. Any other failure is
//          returned immediately; this is not a general retry mechanism.
//==========================================================================================================
class RetryingInvoker {
public:
    // Synchronous credential refresh; std::nullopt means a new credential was installed.
    using RefreshFunction = std::function<std::optional<errors::FetchError>()>;

    RetryingInvoker(RefreshFunction refresh, unsigned int maxTryTimes)
        : refresh(std::move(refresh)), maxTryTimes(maxTryTimes == 0u ? 1u : maxTryTimes) {
        if (!this->refresh) {
            throw std::invalid_argument("RetryingInvoker: refresh function must not be empty");
        }
    }

    //==========================================================================================================
    // Invoke
    // Purpose: Executes op (a zero-argument callable returning Outcome<T>) under the retry policy.
    // Returns:
    //   The first successful or non-credential outcome; when a refresh fails, the outcome that triggered it
    //   with the refresh failure attached as error->cause; otherwise the last outcome once attempts run out.
    //==========================================================================================================
    template <typename Operation>
    std::invoke_result_t<Operation&> Invoke(Operation&& op) const {
        using Result = std::invoke_result_t<Operation&>;
        std::optional<Result> last;
        for (unsigned int attempt = 0u; attempt < maxTryTimes; ++attempt) {
            last.emplace(op());
            if (last->ok()) {
                break;
            }
            if (!errors::isAuthInvalid(*last->error)) {
                break;
            }
            auto fetchErr = refresh();
            if (fetchErr.has_value()) {
                LOG_WARN("RetryingInvoker: operation error: {}, fetch credential error: {}",
                         last->error->ToString(), fetchErr->message);
                last->error->cause = std::move(*fetchErr);
                break;
            }
            LOG_INFO("RetryingInvoker: credential refreshed after auth error (attempt {}/{})",
                     attempt + 1u, maxTryTimes);
        }
        return std::move(*last);
    }

    unsigned int MaxTryTimes() const { return maxTryTimes; }

private:
    RefreshFunction refresh;
    unsigned int maxTryTimes;
};

} // namespace tokenkeeper
