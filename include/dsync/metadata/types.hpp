#pragma once

/**
 * @file types.hpp
 * @brief Core records for drivesync
 *
 * WHY THIS FILE EXISTS:
 * Every layer (walker, diff engine, progress store, downloader, orchestrator)
 * passes the same handful of records around. Keeping them as fixed-field
 * structs means a typo in a field name is a compile error, not a silently
 * missing dictionary key.
 *
 * LIFETIMES:
 * - RemoteFileRecord: snapshot produced once per run by the walker, never mutated
 * - SyncTask: loaded at run start, immutable for the run
 * - ProgressRecord: persisted; mutated only by the worker owning that file
 * - ErrorLogEntry: append-only audit trail
 */

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace dsync {
namespace metadata {

inline constexpr const char* kFolderMediaType = "application/vnd.google-apps.folder";
inline constexpr const char* kNativeDocumentPrefix = "application/vnd.google-apps.";

/**
 * @brief Kind of a native (export-only) document
 */
enum class NativeKind {
    Document,
    Spreadsheet,
    Presentation,
    Other
};

/**
 * @brief Immutable metadata snapshot of one remote item
 *
 * EXAMPLE:
 * id="1AbC", name="report.pdf", path="projects/2024/report.pdf",
 * size=52311, modified_time="2024-01-02T00:00:00.000Z",
 * checksum="9e107d9d372bb6826bd81d3542a419d6"
 */
struct RemoteFileRecord {
    std::string id;                        // Opaque, stable per remote item
    std::string name;                      // Display name (single path segment)
    std::string path;                      // Relative path from the task root, '/'-separated
    std::uint64_t size = 0;                // Bytes (0 for native documents)
    std::string modified_time;             // ISO-8601 as reported by the remote
    std::optional<std::string> checksum;   // MD5 hex, absent for native documents
    std::string media_type;
    bool is_directory = false;
    std::vector<std::string> parent_ids;

    /**
     * Native documents have no byte representation and must be exported
     */
    bool is_native_document() const {
        return !is_directory &&
               media_type.rfind(kNativeDocumentPrefix, 0) == 0 &&
               media_type != kFolderMediaType;
    }

    NativeKind native_kind() const {
        if (media_type == "application/vnd.google-apps.document") return NativeKind::Document;
        if (media_type == "application/vnd.google-apps.spreadsheet") return NativeKind::Spreadsheet;
        if (media_type == "application/vnd.google-apps.presentation") return NativeKind::Presentation;
        return NativeKind::Other;
    }

    std::string checksum_or_empty() const { return checksum.value_or(std::string{}); }
};

/**
 * @brief Inclusion/exclusion rules, all optional and AND-combined
 *
 * Extensions are stored lowercase with a leading dot (".png").
 * Name matching is a case-insensitive substring test.
 */
struct FilterRules {
    std::optional<std::vector<std::string>> include_extensions;
    std::optional<std::vector<std::string>> exclude_extensions;
    std::optional<std::uint64_t> min_size;
    std::optional<std::uint64_t> max_size;
    std::optional<std::string> name_contains;
    std::optional<std::string> name_excludes;

    bool empty() const {
        return !include_extensions && !exclude_extensions && !min_size &&
               !max_size && !name_contains && !name_excludes;
    }
};

// Upper bound on SyncTask::retry_count; the last backoff is 2^10 units
constexpr std::uint32_t kMaxRetryCount = 10;

/**
 * @brief One configured sync job: remote folder → local folder
 */
struct SyncTask {
    std::int64_t id = 0;                    // Assigned by the task store
    std::string name;                       // Unique
    std::string remote_root_id;
    std::string local_root;
    FilterRules filters;
    std::uint32_t concurrency = 3;
    std::uint32_t retry_count = 3;
    std::uint64_t bandwidth_limit_kbps = 0; // 0 = unlimited
    std::string created_at;
};

/**
 * @brief Per-file transfer state
 *
 * STATE TRANSITIONS (per attempt):
 * PENDING → DOWNLOADING → COMPLETED
 *                       → FAILED
 * FAILED → DOWNLOADING only on a later sync run.
 */
enum class TransferStatus {
    Pending,
    Downloading,
    Completed,
    Failed
};

/**
 * @brief Persisted transfer state, unique per (task_id, remote_file_id)
 *
 * INVARIANTS:
 * - downloaded_size <= total_size whenever total_size is known (> 0)
 * - error_count never decreases
 */
struct ProgressRecord {
    std::int64_t id = 0;
    std::int64_t task_id = 0;
    std::string remote_file_id;
    std::string remote_path;
    std::string local_path;
    std::uint64_t total_size = 0;
    std::uint64_t downloaded_size = 0;
    TransferStatus status = TransferStatus::Pending;
    std::string checksum;
    std::uint32_t error_count = 0;
    std::string last_error;
    std::string updated_at;
};

/**
 * @brief Append-only audit entry for a failed attempt
 */
struct ErrorLogEntry {
    std::int64_t id = 0;
    std::int64_t task_id = 0;
    std::string file_path;
    std::string kind;          // ErrorKindUtils::to_string(...)
    std::string message;
    std::uint32_t retry_count = 0;
    std::string timestamp;
};

/**
 * @brief Aggregate counts over a task's progress records
 */
struct ProgressStats {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t pending = 0;  // pending + downloading
};

class TransferStatusUtils {
public:
    static std::string to_string(TransferStatus status) {
        switch (status) {
            case TransferStatus::Pending: return "pending";
            case TransferStatus::Downloading: return "downloading";
            case TransferStatus::Completed: return "completed";
            case TransferStatus::Failed: return "failed";
            default: return "unknown";
        }
    }

    static std::optional<TransferStatus> from_string(const std::string& text) {
        if (text == "pending") return TransferStatus::Pending;
        if (text == "downloading") return TransferStatus::Downloading;
        if (text == "completed") return TransferStatus::Completed;
        if (text == "failed") return TransferStatus::Failed;
        return std::nullopt;
    }

    /**
     * Legal moves of the per-file state machine within one attempt.
     * Failed/Completed → Downloading is how a later run re-enters the machine.
     */
    static bool can_transition(TransferStatus from, TransferStatus to) {
        if (from == to) {
            return true;
        }
        switch (from) {
            case TransferStatus::Pending:
                return to == TransferStatus::Downloading || to == TransferStatus::Failed;
            case TransferStatus::Downloading:
                return to == TransferStatus::Completed || to == TransferStatus::Failed;
            case TransferStatus::Failed:
            case TransferStatus::Completed:
                return to == TransferStatus::Downloading;
        }
        return false;
    }
};

} // namespace metadata
} // namespace dsync
