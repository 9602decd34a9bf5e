/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON file persistence. Reads documents from disk and replaces them
 * atomically (write temp file, fsync, rename) so a crash mid-write never
 * leaves a truncated file behind.
 * =================================================================================
 */
#ifndef STORAGE_H
#define STORAGE_H

#include <ArduinoJson.h>
#include <string>

/**
 * Loads and parses a JSON file.
 * @return false if the file is missing or unparsable (reason in errorMsg).
 *         'missing' is set when the file simply does not exist.
 */
bool readJsonFile(const std::string &path, JsonDocument &doc, std::string &errorMsg, bool &missing);

/**
 * Serializes 'doc' to 'path' via a temporary file and rename().
 * @return false on any I/O error (reason in errorMsg).
 */
bool writeJsonFileAtomic(const std::string &path, const JsonDocument &doc, std::string &errorMsg);

// Creates the parent directory of 'path' if needed (one level).
bool ensureParentDirectory(const std::string &path);

#endif
