#pragma once
#include <schema/comparison_outcome.h>
#include <schema/finding.h>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Append-only audit log of a run, one JSON object per line.
// Every entry carries the SHA-256 of the previous one, so edits or removed
// lines break the chain and are caught by AuditChain::verify.

struct LogEntry {
    std::string event_type;
    std::string run_id;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

struct VerifyResult {
    bool intact;
    size_t entries;
    size_t failed_index;   // Entry where verification stopped, if not intact
    std::string reason;

    VerifyResult() : intact(true), entries(0), failed_index(0) {}
};

class AuditChain {
public:
    static constexpr const char* kGenesis = "sha256:genesis";

    /**
     * @brief Open a log for appending, continuing any existing chain
     * @param log_path Path to the JSONL file (created if needed)
     * @param run_id Identifier of this run
     */
    AuditChain(const std::string& log_path, const std::string& run_id);

    bool is_open() const { return stream_.is_open(); }

    /**
     * @brief Append an event, chained to the previous entry
     * @param event_type Event name (e.g., "finding_recorded")
     * @param payload Event data
     * @return false if the file is not writable
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    bool record_finding(const Finding& finding);
    bool record_inconclusive(const ComparisonOutcome& outcome);

    std::string last_hash() const;

    /**
     * @brief Check every hash and link of a log file
     * @param log_path Path to the log
     * @return Verification result; an empty or missing log is intact
     */
    static VerifyResult verify(const std::string& log_path);

    static std::vector<LogEntry> load(const std::string& log_path);

    static std::string compute_hash(const LogEntry& entry);

    /// Run identifier derived from the current UTC time.
    static std::string make_run_id();

private:
    std::string run_id_;
    std::string last_hash_;
    std::ofstream stream_;
    mutable std::mutex mutex_;

    static std::string timestamp();
};

} // namespace logging
