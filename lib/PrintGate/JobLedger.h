/*
 * =================================================================================
 * File:      lib/PrintGate/JobLedger.h
 * Description: Known-jobs table. Per printer, the job ids already evaluated.
 * Only touched from the poll thread.
 * =================================================================================
 */
#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "Types.h"

class JobLedger {
public:
    typedef std::set<uint32_t> JobIdSet;

    // Ids in 'current' that are not yet known for 'printer', in ascending order.
    std::vector<uint32_t> findNew(const std::string& printer, const JobIdSet& current) const;

    // Replaces (not merges) the known set for 'printer'.
    void replace(const std::string& printer, const JobIdSet& current);

    bool isKnown(const std::string& printer, uint32_t jobId) const;
    size_t knownCount(const std::string& printer) const;
    size_t totalKnown() const;
    size_t printerCount() const { return _known.size(); }

    void clear() { _known.clear(); }

    static JobIdSet idsOf(const std::vector<PrintJob>& jobs);

private:
    std::map<std::string, JobIdSet> _known;
};
