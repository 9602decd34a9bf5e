/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      src/JsonFileStore.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Local key-path document store. Paths are '/' separated object keys.
 * =================================================================================
 */
#include <errno.h>
#include <fcntl.h>
#include <math.h>
#include <string.h>
#include <sys/file.h>
#include <unistd.h>
#include <vector>

#include "JsonFileStore.h"
#include "Storage.h"

// Tolerance when comparing the stored balance to the one we read.
static const double CAS_EPSILON = 1e-9;

// =================================================================================
// SECTION: HELPERS
// =================================================================================

namespace {

// Exclusive advisory lock on "<store>.lock", released on scope exit.
class FileLock {
public:
  explicit FileLock(const std::string &storePath) : _fd(-1) {
    std::string lockPath = storePath + ".lock";
    ensureParentDirectory(lockPath);
    _fd = open(lockPath.c_str(), O_RDWR | O_CREAT, 0644);
    if (_fd < 0) {
      _error = lockPath + ": " + strerror(errno);
      return;
    }
    while (flock(_fd, LOCK_EX) != 0) {
      if (errno != EINTR) {
        _error = lockPath + ": flock: " + strerror(errno);
        close(_fd);
        _fd = -1;
        return;
      }
    }
  }

  ~FileLock() {
    if (_fd >= 0) {
      flock(_fd, LOCK_UN);
      close(_fd);
    }
  }

  bool isLocked() const { return _fd >= 0; }
  const std::string &error() const { return _error; }

private:
  int _fd;
  std::string _error;

  FileLock(const FileLock &);
  FileLock &operator=(const FileLock &);
};

std::vector<std::string> splitPath(const std::string &path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    if (slash == std::string::npos)
      slash = path.size();
    if (slash > start)
      segments.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return segments;
}

// Loads the store file. A missing file is an empty store.
bool loadRoot(const std::string &filePath, JsonDocument &doc, std::string &errorMsg) {
  bool missing = false;
  if (!readJsonFile(filePath, doc, errorMsg, missing)) {
    if (!missing)
      return false;
    doc.clear();
  }
  if (!doc.is<JsonObject>()) {
    if (!doc.isNull()) {
      errorMsg = filePath + ": root is not an object";
      return false;
    }
    doc.to<JsonObject>();
  }
  return true;
}

} // namespace

JsonFileStore::JsonFileStore(const std::string &filePath) : _filePath(filePath) {}

// =================================================================================
// SECTION: READ
// =================================================================================

StoreResult<JsonDocument> JsonFileStore::get(const std::string &path) {
  std::lock_guard<std::mutex> guard(_mutex);
  FileLock lock(_filePath);
  if (!lock.isLocked())
    return StoreResult<JsonDocument>::fail(STORE_IO, lock.error());

  JsonDocument root;
  std::string errorMsg;
  if (!loadRoot(_filePath, root, errorMsg))
    return StoreResult<JsonDocument>::fail(STORE_PARSE, errorMsg);

  JsonVariantConst node = root.as<JsonVariantConst>();
  std::vector<std::string> segments = splitPath(path);
  for (size_t i = 0; i < segments.size(); i++) {
    node = node[segments[i]];
    if (node.isNull())
      return StoreResult<JsonDocument>::fail(STORE_NOT_FOUND, "No data at " + path);
  }

  JsonDocument out;
  out.set(node);
  return StoreResult<JsonDocument>::ok(out);
}

// =================================================================================
// SECTION: WRITE
// =================================================================================

StoreResult<StoreAck> JsonFileStore::update(const std::string &path, const JsonDocument &fields) {
  return writeFields(path, nullptr, 0.0, fields);
}

StoreResult<StoreAck> JsonFileStore::updateIfEquals(const std::string &path, const char *field, double expected,
                                                    const JsonDocument &fields) {
  if (field == nullptr || field[0] == '\0')
    return StoreResult<StoreAck>::fail(STORE_UNSUPPORTED, "Compare field required");
  return writeFields(path, field, expected, fields);
}

StoreResult<StoreAck> JsonFileStore::writeFields(const std::string &path, const char *field, double expected,
                                                 const JsonDocument &fields) {
  if (!fields.is<JsonObjectConst>())
    return StoreResult<StoreAck>::fail(STORE_PARSE, "Update fields must be an object");

  std::lock_guard<std::mutex> guard(_mutex);
  FileLock lock(_filePath);
  if (!lock.isLocked())
    return StoreResult<StoreAck>::fail(STORE_IO, lock.error());

  JsonDocument root;
  std::string errorMsg;
  if (!loadRoot(_filePath, root, errorMsg))
    return StoreResult<StoreAck>::fail(STORE_PARSE, errorMsg);

  // 1. Walk (and create) the target object
  JsonObject target = root.as<JsonObject>();
  std::vector<std::string> segments = splitPath(path);
  for (size_t i = 0; i < segments.size(); i++) {
    JsonVariant child = target[segments[i]];
    if (child.isNull()) {
      target = target[segments[i]].to<JsonObject>();
    } else if (child.is<JsonObject>()) {
      target = child.as<JsonObject>();
    } else {
      return StoreResult<StoreAck>::fail(STORE_PARSE, "Not an object: " + segments[i] + " in " + path);
    }
  }

  // 2. Compare (CAS)
  if (field != nullptr) {
    double current = target[field] | 0.0;
    if (fabs(current - expected) > CAS_EPSILON) {
      return StoreResult<StoreAck>::fail(STORE_CONFLICT, std::string(field) + " changed concurrently");
    }
  }

  // 3. Merge & persist
  for (JsonPairConst kv : fields.as<JsonObjectConst>()) {
    target[kv.key()] = kv.value();
  }

  if (!writeJsonFileAtomic(_filePath, root, errorMsg))
    return StoreResult<StoreAck>::fail(STORE_IO, errorMsg);

  return StoreResult<StoreAck>::ok(StoreAck());
}
