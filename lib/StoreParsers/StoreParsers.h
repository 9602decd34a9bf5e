#pragma once
#include <ArduinoJson.h>
#include <string>
#include "Types.h"

class StoreParsers {
public:
    // Reads per-page prices from the "metadata" document.
    // Missing or invalid fields are taken from 'defaults'. Returns false if any
    // field had to be defaulted, with the reason in errorMsg.
    static bool parsePricing(JsonVariantConst json, const PricingSnapshot& defaults, PricingSnapshot& outPricing, std::string& errorMsg);

    // Reads "remainingPrints" from a user document. A missing field is a zero balance.
    // Returns false if the field exists but is not a number.
    static bool parseBudget(JsonVariantConst json, double& outBudget, std::string& errorMsg);

    // Same, also returning the value as stored (0 when missing). A negative
    // stored balance reads as 0 in outBudget but keeps its sign in outStored.
    static bool parseBudget(JsonVariantConst json, double& outBudget, double& outStored, std::string& errorMsg);

    // Parses "HH:MM" (24h) into minutes after midnight.
    static bool parseClockTime(const char* text, uint16_t& outMinutes, std::string& errorMsg);

    // Parses the operating hours settings document. Invalid fields keep the
    // values already in outHours.
    static bool parseOperatingHours(JsonVariantConst json, OperatingHours& outHours, std::string& errorMsg);
};
