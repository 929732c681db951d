//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Outcome.h
// Purpose: (result, error) pair returned by every remote operation of the underlying client
//==========================================================================================================

#pragma once

#include <optional>
#include <utility>

#include "tokenkeeper/errors/Errors.h"

namespace tokenkeeper {

//==========================================================================================================
// Outcome<T>
// Purpose: Result of a remote operation. When error is set the operation failed; value may still carry a
//          partial result the operation produced before failing.
//==========================================================================================================
template <typename T>
struct Outcome {
    using ValueType = T;

    std::optional<T> value;
    std::optional<errors::ServiceError> error;

    static Outcome Success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }

    static Outcome Failure(errors::ServiceError e) {
        Outcome o;
        o.error = std::move(e);
        return o;
    }

    bool ok() const { return !error.has_value(); }
};

template <>
struct Outcome<void> {
    using ValueType = void;

    std::optional<errors::ServiceError> error;

    static Outcome Success() { return Outcome{}; }

    static Outcome Failure(errors::ServiceError e) {
        Outcome o;
        o.error = std::move(e);
        return o;
    }

    bool ok() const { return !error.has_value(); }
};

} // namespace tokenkeeper
