/*
 * nanoclaw C++ - Output Extractor
 *
 * Recovers the single result object from a sandbox's stdout. The workload
 * brackets it with sentinel markers:
 *
 *   ...library banners, progress...
 *   ---NANOCLAW_OUTPUT_START---
 *   {"status":"success","result":"...","newSessionId":"..."}
 *   ---NANOCLAW_OUTPUT_END---
 *
 * Without both markers (in order) the last non-blank line is parsed instead,
 * for workloads that only print one trailing result line.
 */
#ifndef nanoclaw_CORE_OUTPUT_EXTRACTOR_HPP
#define nanoclaw_CORE_OUTPUT_EXTRACTOR_HPP

#include "types.hpp"
#include <string>

namespace nanoclaw {

class OutputExtractor {
public:
    static const char* const DEFAULT_START_MARKER;
    static const char* const DEFAULT_END_MARKER;
    static const size_t ERROR_TAIL_BYTES = 200;

    OutputExtractor();
    OutputExtractor(const std::string& start_marker, const std::string& end_marker);

    // Text that will be parsed; delimited is set when the markers were used
    std::string candidate(const std::string& output, bool& delimited) const;

    // False with a reason when no well-formed result object is present
    bool try_extract(const std::string& output, JobResult& out, std::string& reason) const;

    // Never throws; a malformed result becomes status=error naming the
    // parse failure, followed by the tail of the raw output
    JobResult extract(const std::string& output) const;

    const std::string& start_marker() const { return start_marker_; }
    const std::string& end_marker() const { return end_marker_; }

private:
    std::string start_marker_;
    std::string end_marker_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_OUTPUT_EXTRACTOR_HPP
