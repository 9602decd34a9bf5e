/*
 * =================================================================================
 * File:      lib/PrintGate/BudgetStore.h
 * Description: Abstraction of the remote key-path document store.
 * Paths are '/' separated ("metadata", "users/{id}").
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>
#include "StoreResult.h"

class IBudgetStore {
public:
    virtual ~IBudgetStore() {}

    // Reads the document at 'path'. STORE_NOT_FOUND if nothing exists there.
    virtual StoreResult<JsonDocument> get(const std::string& path) = 0;

    // Merges the top-level keys of 'fields' into the document at 'path'.
    virtual StoreResult<StoreAck> update(const std::string& path, const JsonDocument& fields) = 0;

    // Compare-and-swap: applies 'fields' only if the numeric 'field' still equals
    // 'expected'. Returns STORE_CONFLICT when it changed underneath us.
    // Stores without native support return STORE_UNSUPPORTED.
    virtual StoreResult<StoreAck> updateIfEquals(const std::string& path, const char* field, double expected,
                                                 const JsonDocument& fields) {
        (void)path;
        (void)field;
        (void)expected;
        (void)fields;
        return StoreResult<StoreAck>::fail(STORE_UNSUPPORTED, "Conditional writes not supported");
    }
};
