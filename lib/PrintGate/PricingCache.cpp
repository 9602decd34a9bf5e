/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/PricingCache.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>
#include <string>

#include "PricingCache.h"
#include "StoreParsers.h"

PricingCache::PricingCache(IKioskHAL& hal, const PricingSnapshot& defaults)
    : _hal(hal), _defaults(defaults), _current(defaults), _usingDefaults(true) {}

void PricingCache::logKeyValue(const char *key, const char *value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

const PricingSnapshot& PricingCache::load(IBudgetStore& store) {
    char logBuf[MAX_LOG_LENGTH];
    _current = _defaults;
    _usingDefaults = true;

    StoreResult<JsonDocument> result = store.get(STORE_PATH_METADATA);
    const JsonDocument* doc = result.get();

    if (doc == nullptr) {
        snprintf(logBuf, sizeof(logBuf), "WARNING: Pricing unavailable (%s: %s). Using defaults.",
                 storeErrorToString(result.errorKind()), result.errorMessage().c_str());
        logKeyValue("Pricing", logBuf);
    } else {
        std::string errorMsg;
        if (StoreParsers::parsePricing(doc->as<JsonVariantConst>(), _defaults, _current, errorMsg)) {
            _usingDefaults = false;
        } else {
            snprintf(logBuf, sizeof(logBuf), "WARNING: %s Defaults applied.", errorMsg.c_str());
            logKeyValue("Pricing", logBuf);
        }
    }

    snprintf(logBuf, sizeof(logBuf), "B/W %.2f / Color %.2f per page%s", _current.blackWhitePricePerPage,
             _current.colorPricePerPage, _usingDefaults ? " (defaults)" : "");
    logKeyValue("Pricing", logBuf);

    return _current;
}

double PricingCache::costOf(int pages, bool isColor) const {
    double pricePerPage = isColor ? _current.colorPricePerPage : _current.blackWhitePricePerPage;
    return pages * pricePerPage;
}
