/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/StoreResult.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Tagged result of a BudgetStore call. Either Ok(value) or Err(kind, message).
 * The payload is only reachable through value()/get(), which refuse to hand
 * it out on failure.
 * =================================================================================
 */
#pragma once
#include <string>
#include <utility>
#include "Types.h"

// Empty payload for writes that only report success/failure.
struct StoreAck {};

template <typename T>
class StoreResult {
public:
    static StoreResult ok(T value) {
        StoreResult r;
        r._kind = STORE_OK;
        r._value = std::move(value);
        return r;
    }

    static StoreResult fail(StoreErrorKind kind, const std::string& message) {
        StoreResult r;
        r._kind = (kind == STORE_OK) ? STORE_IO : kind;
        r._message = message;
        return r;
    }

    bool isOk() const { return _kind == STORE_OK; }
    StoreErrorKind errorKind() const { return _kind; }
    const std::string& errorMessage() const { return _message; }

    // Copies the payload into 'out'. Returns false and leaves 'out' untouched on failure.
    bool value(T& out) const {
        if (!isOk()) return false;
        out = _value;
        return true;
    }

    // Returns nullptr on failure.
    const T* get() const { return isOk() ? &_value : nullptr; }

private:
    StoreResult() : _kind(STORE_IO) {}

    StoreErrorKind _kind;
    std::string _message;
    T _value;
};
