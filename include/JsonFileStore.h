/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      include/JsonFileStore.h
 * Description: IBudgetStore backed by a JSON document on local disk.
 * - Re-read on every call so edits by an administrator are seen at once.
 * - Writes are atomic; an exclusive flock serializes kiosk processes that
 *   share the file, which makes updateIfEquals a real compare-and-swap.
 * =================================================================================
 */
#pragma once
#include <mutex>
#include <string>
#include "BudgetStore.h"

class JsonFileStore : public IBudgetStore {
public:
  explicit JsonFileStore(const std::string &filePath);

  StoreResult<JsonDocument> get(const std::string &path) override;
  StoreResult<StoreAck> update(const std::string &path, const JsonDocument &fields) override;
  StoreResult<StoreAck> updateIfEquals(const std::string &path, const char *field, double expected,
                                       const JsonDocument &fields) override;

  const std::string &getFilePath() const { return _filePath; }

private:
  std::string _filePath;
  std::mutex _mutex;

  // Caller holds the locks. 'expected' is ignored unless 'field' is set.
  StoreResult<StoreAck> writeFields(const std::string &path, const char *field, double expected, const JsonDocument &fields);
};
