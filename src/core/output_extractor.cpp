/*
 * nanoclaw C++ - Output Extractor Implementation
 */
#include <nanoclaw/core/output_extractor.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

const char* const OutputExtractor::DEFAULT_START_MARKER = "---NANOCLAW_OUTPUT_START---";
const char* const OutputExtractor::DEFAULT_END_MARKER = "---NANOCLAW_OUTPUT_END---";

OutputExtractor::OutputExtractor()
    : start_marker_(DEFAULT_START_MARKER)
    , end_marker_(DEFAULT_END_MARKER) {}

OutputExtractor::OutputExtractor(const std::string& start_marker, const std::string& end_marker)
    : start_marker_(start_marker)
    , end_marker_(end_marker) {}

std::string OutputExtractor::candidate(const std::string& output, bool& delimited) const {
    delimited = false;

    size_t start = output.find(start_marker_);
    if (start != std::string::npos) {
        size_t body = start + start_marker_.size();
        size_t end = output.find(end_marker_, body);
        if (end != std::string::npos) {
            delimited = true;
            return trim(output.substr(body, end - body));
        }
    }

    // Legacy: last non-blank line
    std::string trimmed = trim(output);
    size_t nl = trimmed.rfind('\n');
    std::string last = (nl == std::string::npos) ? trimmed : trimmed.substr(nl + 1);
    return trim(last);
}

bool OutputExtractor::try_extract(const std::string& output, JobResult& out, std::string& reason) const {
    bool delimited = false;
    std::string text = candidate(output, delimited);
    if (text.empty()) {
        reason = "no result in output";
        return false;
    }

    try {
        Json parsed = Json::parse(text);
        if (!parse_job_result(parsed, out, reason)) {
            return false;
        }
    } catch (const Json::exception& e) {
        reason = e.what();
        return false;
    }

    LOG_DEBUG("[OutputExtractor] Parsed result (%s)", delimited ? "delimited" : "last line");
    return true;
}

JobResult OutputExtractor::extract(const std::string& output) const {
    JobResult result;
    std::string reason;
    if (try_extract(output, result, reason)) {
        return result;
    }

    std::string tail = tail_safe(output, ERROR_TAIL_BYTES);
    LOG_ERROR("[OutputExtractor] Failed to parse container output: %s", reason.c_str());
    return JobResult::fail("Failed to parse container output: " + reason +
                           (tail.empty() ? std::string() : "\nOutput tail: " + tail));
}

} // namespace nanoclaw
