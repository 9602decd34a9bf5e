/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON file persistence shared by the settings loader, the crash journal and
 * the file-backed budget store.
 * =================================================================================
 */
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "Storage.h"

// =================================================================================
// SECTION: READ
// =================================================================================

bool readJsonFile(const std::string &path, JsonDocument &doc, std::string &errorMsg, bool &missing) {
  missing = false;

  FILE *file = fopen(path.c_str(), "rb");
  if (file == NULL) {
    missing = (errno == ENOENT);
    errorMsg = path + ": " + strerror(errno);
    return false;
  }

  std::string content;
  char chunk[4096];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
    content.append(chunk, n);
  }
  bool readError = ferror(file) != 0;
  fclose(file);

  if (readError) {
    errorMsg = path + ": read error";
    return false;
  }

  DeserializationError err = deserializeJson(doc, content);
  if (err) {
    errorMsg = path + ": " + err.c_str();
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: WRITE
// =================================================================================

bool ensureParentDirectory(const std::string &path) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0)
    return true;

  std::string dir = path.substr(0, slash);
  if (mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST)
    return true;
  return false;
}

bool writeJsonFileAtomic(const std::string &path, const JsonDocument &doc, std::string &errorMsg) {
  std::string payload;
  serializeJsonPretty(doc, payload);

  if (!ensureParentDirectory(path)) {
    errorMsg = path + ": cannot create directory: " + strerror(errno);
    return false;
  }

  std::string tmpPath = path + ".tmp";
  int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    errorMsg = tmpPath + ": " + strerror(errno);
    return false;
  }

  // 1. Write everything (short writes are legal)
  size_t offset = 0;
  while (offset < payload.size()) {
    ssize_t written = write(fd, payload.data() + offset, payload.size() - offset);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      errorMsg = tmpPath + ": " + strerror(errno);
      close(fd);
      unlink(tmpPath.c_str());
      return false;
    }
    offset += (size_t)written;
  }

  // 2. Flush to disk before the rename makes it visible
  if (fsync(fd) != 0) {
    errorMsg = tmpPath + ": fsync: " + strerror(errno);
    close(fd);
    unlink(tmpPath.c_str());
    return false;
  }
  close(fd);

  // 3. Swap in
  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    errorMsg = path + ": rename: " + strerror(errno);
    unlink(tmpPath.c_str());
    return false;
  }
  return true;
}
