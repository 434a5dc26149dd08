#pragma once

// ============================================================
// sample_grouper.hpp -- R1/R2/I1 sample triples and the
//   tab-delimited sample descriptor
// ============================================================

#include "transfer_types.hpp"
#include <string>
#include <vector>

namespace grouper {

// Data files must end with this suffix to take part in grouping
static constexpr const char* DATA_SUFFIX = ".fastq.gz";

enum class Role {
    R1,
    R2,
    I1,
    NONE,
};

// Role from the "_R1_" / "_R2_" / "_I1_" marker of a data file name;
// NONE for anything else
Role classify(const std::string& name);

struct GroupingResult {
    std::vector<SampleRecord>          records;     // input group order
    std::vector<IncompleteGroupReport> incomplete;
    std::vector<std::string>           skipped;     // non-data member names
};

// One complete record per group holding exactly one name of each role
GroupingResult group(const std::vector<ExtractedGroup>& groups);

// "sample\tr1\tr2\ti1\n" per record; throws std::runtime_error on I/O failure
void write_descriptor(const std::vector<SampleRecord>& records, const std::string& path);

} // namespace grouper
