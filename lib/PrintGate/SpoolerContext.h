/*
 * =================================================================================
 * File:      lib/PrintGate/SpoolerContext.h
 * Description: Abstraction layer for the OS print subsystem.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "Types.h"

class ISpoolerAdapter {
public:
    virtual ~ISpoolerAdapter() {}

    // --- Enumeration ---
    // Returns an empty list on any failure.
    virtual std::vector<std::string> listPrinters() = 0;

    // Returns false if the queue could not be read. An empty 'outJobs' with
    // a true return means the queue really is empty.
    virtual bool listJobs(const std::string& printer, std::vector<PrintJob>& outJobs) = 0;

    // Re-reads a single job. Returns false if it is gone or cannot be read.
    virtual bool getJob(const std::string& printer, uint32_t jobId, PrintJob& outJob) = 0;

    // --- Job Control ---
    // Each call opens its own spooler handle and releases it before returning.
    // Returns false on any failure. Implementations must not throw.
    virtual bool pauseJob(const std::string& printer, uint32_t jobId) = 0;
    virtual bool resumeJob(const std::string& printer, uint32_t jobId) = 0;
    virtual bool cancelJob(const std::string& printer, uint32_t jobId) = 0;

    // --- Queue Control ---
    virtual bool pausePrinter(const std::string& printer) = 0;
    virtual bool resumePrinter(const std::string& printer) = 0;
};
