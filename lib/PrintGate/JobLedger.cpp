/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/JobLedger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "JobLedger.h"

std::vector<uint32_t> JobLedger::findNew(const std::string& printer, const JobIdSet& current) const {
    std::vector<uint32_t> fresh;
    std::map<std::string, JobIdSet>::const_iterator it = _known.find(printer);

    for (JobIdSet::const_iterator id = current.begin(); id != current.end(); ++id) {
        if (it == _known.end() || it->second.count(*id) == 0) {
            fresh.push_back(*id);
        }
    }
    return fresh;
}

void JobLedger::replace(const std::string& printer, const JobIdSet& current) {
    _known[printer] = current;
}

bool JobLedger::isKnown(const std::string& printer, uint32_t jobId) const {
    std::map<std::string, JobIdSet>::const_iterator it = _known.find(printer);
    return it != _known.end() && it->second.count(jobId) > 0;
}

size_t JobLedger::knownCount(const std::string& printer) const {
    std::map<std::string, JobIdSet>::const_iterator it = _known.find(printer);
    return it == _known.end() ? 0 : it->second.size();
}

size_t JobLedger::totalKnown() const {
    size_t total = 0;
    for (std::map<std::string, JobIdSet>::const_iterator it = _known.begin(); it != _known.end(); ++it) {
        total += it->second.size();
    }
    return total;
}

JobLedger::JobIdSet JobLedger::idsOf(const std::vector<PrintJob>& jobs) {
    JobIdSet ids;
    for (size_t i = 0; i < jobs.size(); i++) {
        ids.insert(jobs[i].jobId);
    }
    return ids;
}
