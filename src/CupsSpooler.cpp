/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      src/CupsSpooler.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * CUPS implementation of the spooler adapter.
 * - Connections and IPP messages are owned by unique_ptr with deleters, so
 *   they are released on every path.
 * - Failures are logged and reported as false.
 * =================================================================================
 */
#include <memory>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>

#include "CupsSpooler.h"

// =================================================================================
// SECTION: SCOPED HANDLES
// =================================================================================

namespace {

struct HttpDeleter {
  void operator()(http_t *http) const { httpClose(http); }
};
struct IppDeleter {
  void operator()(ipp_t *ipp) const { ippDelete(ipp); }
};
struct DestsDeleter {
  int count;
  void operator()(cups_dest_t *dests) const { cupsFreeDests(count, dests); }
};

using ScopedHttp = std::unique_ptr<http_t, HttpDeleter>;
using ScopedIpp = std::unique_ptr<ipp_t, IppDeleter>;

const int CONNECT_TIMEOUT_MS = 5000;

ScopedHttp openScheduler() {
  return ScopedHttp(httpConnect2(cupsServer(), ippPort(), NULL, AF_UNSPEC, cupsEncryption(), 1, CONNECT_TIMEOUT_MS, NULL));
}

void buildPrinterUri(const std::string &printer, char *uri, size_t size) {
  httpAssembleURIf(HTTP_URI_CODING_ALL, uri, (int)size, "ipp", NULL, "localhost", ippPort(), "/printers/%s", printer.c_str());
}

// Builds a request addressed to a printer, with the operation attributes every call needs.
ipp_t *newPrinterRequest(ipp_op_t op, const std::string &printer) {
  char uri[HTTP_MAX_URI];
  buildPrinterUri(printer, uri, sizeof(uri));

  ipp_t *request = ippNewRequest(op);
  ippAddString(request, IPP_TAG_OPERATION, IPP_TAG_URI, "printer-uri", NULL, uri);
  ippAddString(request, IPP_TAG_OPERATION, IPP_TAG_NAME, "requesting-user-name", NULL, cupsUser());
  return request;
}

bool isSuccess(ipp_status_t status) { return status <= IPP_STATUS_OK_CONFLICTING; }

const char *const JOB_ATTRIBUTES[] = {"job-id", "job-name", "job-impressions", "copies", "job-state-reasons"};
const int JOB_ATTRIBUTE_COUNT = (int)(sizeof(JOB_ATTRIBUTES) / sizeof(JOB_ATTRIBUTES[0]));

PrintJob emptyJob(const std::string &printer) {
  PrintJob job;
  job.jobId = 0;
  job.printerName = printer;
  job.totalPages = 0;
  job.copies = 1;
  job.isColor = false;
  job.spooling = false;
  return job;
}

// "job-incoming": the scheduler is still receiving document data
bool hasIncomingReason(ipp_attribute_t *attr) {
  for (int i = 0; i < ippGetCount(attr); i++) {
    const char *reason = ippGetString(attr, i, NULL);
    if (reason != NULL && strcmp(reason, "job-incoming") == 0)
      return true;
  }
  return false;
}

// Jobs are consecutive attribute groups tagged IPP_TAG_JOB
void readJobGroups(ipp_t *response, const std::string &printer, std::vector<PrintJob> &jobs) {
  PrintJob current = emptyJob(printer);
  bool inJob = false;

  for (ipp_attribute_t *attr = ippFirstAttribute(response); attr != NULL; attr = ippNextAttribute(response)) {
    const char *name = ippGetName(attr);

    if (ippGetGroupTag(attr) != IPP_TAG_JOB || name == NULL) {
      if (inJob && current.jobId != 0)
        jobs.push_back(current);
      inJob = false;
      continue;
    }

    if (!inJob) {
      current = emptyJob(printer);
      inJob = true;
    }

    if (strcmp(name, "job-id") == 0) {
      current.jobId = (uint32_t)ippGetInteger(attr, 0);
    } else if (strcmp(name, "job-name") == 0) {
      const char *docName = ippGetString(attr, 0, NULL);
      current.documentName = docName ? docName : "";
    } else if (strcmp(name, "job-impressions") == 0) {
      current.totalPages = ippGetInteger(attr, 0);
    } else if (strcmp(name, "copies") == 0) {
      current.copies = ippGetInteger(attr, 0);
    } else if (strcmp(name, "job-state-reasons") == 0) {
      current.spooling = hasIncomingReason(attr);
    }
  }
  if (inJob && current.jobId != 0)
    jobs.push_back(current);
}

} // namespace

CupsSpooler::CupsSpooler(IKioskHAL &hal) : _hal(hal) {}

void CupsSpooler::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

// =================================================================================
// SECTION: ENUMERATION
// =================================================================================

std::vector<std::string> CupsSpooler::listPrinters() {
  std::vector<std::string> printers;

  ScopedHttp http = openScheduler();
  if (!http) {
    logKeyValue("Spooler", "Cannot reach CUPS scheduler.");
    return printers;
  }

  cups_dest_t *rawDests = NULL;
  int count = cupsGetDests2(http.get(), &rawDests);
  std::unique_ptr<cups_dest_t, DestsDeleter> dests(rawDests, DestsDeleter{count});

  for (int i = 0; i < count; i++) {
    // Instances share the queue of their base printer
    if (rawDests[i].instance != NULL)
      continue;
    printers.push_back(rawDests[i].name);
  }
  return printers;
}

bool CupsSpooler::listJobs(const std::string &printer, std::vector<PrintJob> &outJobs) {
  char logBuf[MAX_LOG_LENGTH];
  outJobs.clear();

  ScopedHttp http = openScheduler();
  if (!http) {
    logKeyValue("Spooler", "Cannot reach CUPS scheduler.");
    return false;
  }

  ipp_t *request = newPrinterRequest(IPP_OP_GET_JOBS, printer);
  ippAddString(request, IPP_TAG_OPERATION, IPP_TAG_KEYWORD, "which-jobs", NULL, "not-completed");
  ippAddStrings(request, IPP_TAG_OPERATION, IPP_TAG_KEYWORD, "requested-attributes", JOB_ATTRIBUTE_COUNT, NULL,
                JOB_ATTRIBUTES);

  // cupsDoRequest takes ownership of the request
  ScopedIpp response(cupsDoRequest(http.get(), request, "/"));
  if (!response || !isSuccess(cupsLastError())) {
    snprintf(logBuf, sizeof(logBuf), "Get-Jobs on '%s' failed: %s", printer.c_str(), cupsLastErrorString());
    logKeyValue("Spooler", logBuf);
    return false;
  }

  readJobGroups(response.get(), printer, outJobs);
  return true;
}

bool CupsSpooler::getJob(const std::string &printer, uint32_t jobId, PrintJob &outJob) {
  char logBuf[MAX_LOG_LENGTH];

  ScopedHttp http = openScheduler();
  if (!http) {
    logKeyValue("Spooler", "Cannot reach CUPS scheduler.");
    return false;
  }

  ipp_t *request = newPrinterRequest(IPP_OP_GET_JOB_ATTRIBUTES, printer);
  ippAddInteger(request, IPP_TAG_OPERATION, IPP_TAG_INTEGER, "job-id", (int)jobId);
  ippAddStrings(request, IPP_TAG_OPERATION, IPP_TAG_KEYWORD, "requested-attributes", JOB_ATTRIBUTE_COUNT, NULL,
                JOB_ATTRIBUTES);

  ScopedIpp response(cupsDoRequest(http.get(), request, "/"));
  if (!response || !isSuccess(cupsLastError())) {
    snprintf(logBuf, sizeof(logBuf), "Get-Job-Attributes for job %u failed: %s", jobId, cupsLastErrorString());
    logKeyValue("Spooler", logBuf);
    return false;
  }

  std::vector<PrintJob> jobs;
  readJobGroups(response.get(), printer, jobs);
  for (size_t i = 0; i < jobs.size(); i++) {
    if (jobs[i].jobId == jobId) {
      outJob = jobs[i];
      return true;
    }
  }
  return false;
}

// =================================================================================
// SECTION: CONTROL
// =================================================================================

bool CupsSpooler::sendJobOperation(ipp_op_t op, const std::string &printer, uint32_t jobId, const char *label,
                                   bool goneIsSuccess) {
  char logBuf[MAX_LOG_LENGTH];

  ScopedHttp http = openScheduler();
  if (!http) {
    snprintf(logBuf, sizeof(logBuf), "%s job %u: scheduler unreachable", label, jobId);
    logKeyValue("Spooler", logBuf);
    return false;
  }

  ipp_t *request = newPrinterRequest(op, printer);
  ippAddInteger(request, IPP_TAG_OPERATION, IPP_TAG_INTEGER, "job-id", (int)jobId);

  ScopedIpp response(cupsDoRequest(http.get(), request, "/jobs/"));
  ipp_status_t status = cupsLastError();
  if (response && isSuccess(status))
    return true;

  // The job already left the queue: the end state we wanted
  if (goneIsSuccess && (status == IPP_STATUS_ERROR_NOT_FOUND || status == IPP_STATUS_ERROR_NOT_POSSIBLE)) {
    snprintf(logBuf, sizeof(logBuf), "%s job %u: already finished (%s)", label, jobId, ippErrorString(status));
    logKeyValue("Spooler", logBuf);
    return true;
  }

  snprintf(logBuf, sizeof(logBuf), "%s job %u on '%s' failed: %s", label, jobId, printer.c_str(), cupsLastErrorString());
  logKeyValue("Spooler", logBuf);
  return false;
}

bool CupsSpooler::sendPrinterOperation(ipp_op_t op, const std::string &printer, const char *label) {
  char logBuf[MAX_LOG_LENGTH];

  ScopedHttp http = openScheduler();
  if (!http) {
    snprintf(logBuf, sizeof(logBuf), "%s '%s': scheduler unreachable", label, printer.c_str());
    logKeyValue("Spooler", logBuf);
    return false;
  }

  ipp_t *request = newPrinterRequest(op, printer);
  ScopedIpp response(cupsDoRequest(http.get(), request, "/admin/"));
  if (response && isSuccess(cupsLastError()))
    return true;

  snprintf(logBuf, sizeof(logBuf), "%s '%s' failed: %s", label, printer.c_str(), cupsLastErrorString());
  logKeyValue("Spooler", logBuf);
  return false;
}

bool CupsSpooler::pauseJob(const std::string &printer, uint32_t jobId) {
  return sendJobOperation(IPP_OP_HOLD_JOB, printer, jobId, "Hold", false);
}

bool CupsSpooler::resumeJob(const std::string &printer, uint32_t jobId) {
  return sendJobOperation(IPP_OP_RELEASE_JOB, printer, jobId, "Release", true);
}

bool CupsSpooler::cancelJob(const std::string &printer, uint32_t jobId) {
  return sendJobOperation(IPP_OP_CANCEL_JOB, printer, jobId, "Cancel", true);
}

bool CupsSpooler::pausePrinter(const std::string &printer) {
  return sendPrinterOperation(IPP_OP_PAUSE_PRINTER, printer, "Pause queue");
}

bool CupsSpooler::resumePrinter(const std::string &printer) {
  return sendPrinterOperation(IPP_OP_RESUME_PRINTER, printer, "Resume queue");
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void CupsSpooler::printStartupDiagnostics() {
  char logBuf[128];

  _hal.log("");
  _hal.log("[ PRINT SPOOLER ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s:%d", "CUPS Server", cupsServer(), ippPort());
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Requesting User", cupsUser());
  _hal.log(logBuf);

  std::vector<std::string> printers = listPrinters();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Printers Found", (unsigned)printers.size());
  _hal.log(logBuf);
  for (size_t i = 0; i < printers.size(); i++) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "  Queue", printers[i].c_str());
    _hal.log(logBuf);
  }
}
