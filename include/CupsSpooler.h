/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      include/CupsSpooler.h
 * Description: ISpoolerAdapter over the local CUPS scheduler (IPP).
 * Every call opens its own scheduler connection and closes it on return.
 * =================================================================================
 */
#pragma once

#include <cups/cups.h>
#include <string>
#include <vector>

#include "KioskContext.h"
#include "SpoolerContext.h"

class CupsSpooler : public ISpoolerAdapter {
public:
  explicit CupsSpooler(IKioskHAL &hal);

  // --- Enumeration ---
  std::vector<std::string> listPrinters() override;
  bool listJobs(const std::string &printer, std::vector<PrintJob> &outJobs) override;
  bool getJob(const std::string &printer, uint32_t jobId, PrintJob &outJob) override;

  // --- Job Control (Hold-Job / Release-Job / Cancel-Job) ---
  bool pauseJob(const std::string &printer, uint32_t jobId) override;
  bool resumeJob(const std::string &printer, uint32_t jobId) override;
  bool cancelJob(const std::string &printer, uint32_t jobId) override;

  // --- Queue Control (Pause-Printer / Resume-Printer) ---
  bool pausePrinter(const std::string &printer) override;
  bool resumePrinter(const std::string &printer) override;

  void printStartupDiagnostics();

private:
  IKioskHAL &_hal;

  bool sendJobOperation(ipp_op_t op, const std::string &printer, uint32_t jobId, const char *label, bool goneIsSuccess);
  bool sendPrinterOperation(ipp_op_t op, const std::string &printer, const char *label);

  void logKeyValue(const char *key, const char *value);
};
