/*
 * =================================================================================
 * File:      lib/PrintGate/PricingCache.h
 * Description: Per-page price snapshot, loaded once per monitoring run.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "KioskContext.h"
#include "BudgetStore.h"

class PricingCache {
public:
    PricingCache(IKioskHAL& hal, const PricingSnapshot& defaults);

    // Reads "metadata" from the store. Falls back to defaults (with a warning)
    // on read failure or missing/invalid fields. Never fails.
    const PricingSnapshot& load(IBudgetStore& store);

    const PricingSnapshot& get() const { return _current; }
    const PricingSnapshot& getDefaults() const { return _defaults; }
    bool isUsingDefaults() const { return _usingDefaults; }

    // Price of 'pages' billed pages.
    double costOf(int pages, bool isColor) const;

private:
    IKioskHAL& _hal;
    PricingSnapshot _defaults;
    PricingSnapshot _current;
    bool _usingDefaults;

    void logKeyValue(const char *key, const char *value);
};
