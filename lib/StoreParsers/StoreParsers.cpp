#include "StoreParsers.h"
#include <stdio.h>
#include <string.h>

bool StoreParsers::parsePricing(JsonVariantConst json, const PricingSnapshot& defaults, PricingSnapshot& outPricing, std::string& errorMsg) {
    outPricing = defaults;
    bool allValid = true;

    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Pricing document is not an object.";
        return false;
    }

    // 1. Black & White
    if (json[FIELD_BW_PRICE].is<double>()) {
        double price = json[FIELD_BW_PRICE].as<double>();
        if (price >= 0.0) {
            outPricing.blackWhitePricePerPage = price;
        } else {
            errorMsg = "Negative blackAndWhitePrice rejected.";
            allValid = false;
        }
    } else {
        errorMsg = "blackAndWhitePrice missing or not a number.";
        allValid = false;
    }

    // 2. Color
    if (json[FIELD_COLOR_PRICE].is<double>()) {
        double price = json[FIELD_COLOR_PRICE].as<double>();
        if (price >= 0.0) {
            outPricing.colorPricePerPage = price;
        } else {
            errorMsg = "Negative colorPrice rejected.";
            allValid = false;
        }
    } else {
        // Keep the first complaint if both are broken
        if (allValid) errorMsg = "colorPrice missing or not a number.";
        allValid = false;
    }

    return allValid;
}

bool StoreParsers::parseBudget(JsonVariantConst json, double& outBudget, std::string& errorMsg) {
    double stored = 0.0;
    return parseBudget(json, outBudget, stored, errorMsg);
}

bool StoreParsers::parseBudget(JsonVariantConst json, double& outBudget, double& outStored, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "User document is not an object.";
        return false;
    }

    JsonVariantConst field = json[FIELD_REMAINING_PRINTS];
    if (field.isNull()) {
        outBudget = 0.0;
        outStored = 0.0;
        return true;
    }
    if (!field.is<double>()) {
        errorMsg = "remainingPrints is not a number.";
        return false;
    }

    double value = field.as<double>();
    outStored = value;
    outBudget = value < 0.0 ? 0.0 : value;
    return true;
}

bool StoreParsers::parseClockTime(const char* text, uint16_t& outMinutes, std::string& errorMsg) {
    if (!text || strlen(text) == 0) {
        errorMsg = "Time cannot be empty.";
        return false;
    }

    unsigned int hours = 0;
    unsigned int minutes = 0;
    char trailing = '\0';
    if (sscanf(text, "%u:%u%c", &hours, &minutes, &trailing) != 2) {
        errorMsg = std::string("Invalid time format (expected HH:MM): ") + text;
        return false;
    }
    if (hours > 23 || minutes > 59) {
        errorMsg = std::string("Time out of range: ") + text;
        return false;
    }

    outMinutes = (uint16_t)(hours * 60 + minutes);
    return true;
}

bool StoreParsers::parseOperatingHours(JsonVariantConst json, OperatingHours& outHours, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Operating hours document is not an object.";
        return false;
    }

    outHours.enabled = json["enabled"] | outHours.enabled;

    // 1. Window
    uint16_t parsed = 0;
    const char* startStr = json["startTime"] | "";
    if (strlen(startStr) > 0) {
        if (!parseClockTime(startStr, parsed, errorMsg)) return false;
        outHours.startMinute = parsed;
    }

    const char* endStr = json["endTime"] | "";
    if (strlen(endStr) > 0) {
        if (!parseClockTime(endStr, parsed, errorMsg)) return false;
        outHours.endMinute = parsed;
    }

    // 2. Grace period (capped at 2 hours)
    if (json["gracePeriodMinutes"].is<int>()) {
        int grace = json["gracePeriodMinutes"].as<int>();
        if (grace < 0 || grace > 120) {
            errorMsg = "gracePeriodMinutes out of range (0-120).";
            return false;
        }
        outHours.gracePeriodMinutes = (uint32_t)grace;
    }

    // 3. Behavior
    std::string behavior = json["graceBehavior"] | "graceful";
    if (behavior == "force") outHours.forceEnd = true;
    else if (behavior == "graceful") outHours.forceEnd = false;
    else {
        errorMsg = "Invalid graceBehavior: " + behavior;
        return false;
    }

    return true;
}
