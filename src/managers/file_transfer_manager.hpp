#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection_pool.hpp>
#include <util/worker_pool.hpp>

enum class TransferDirection { Upload, Download };
enum class TransferState { Pending, Running, Done, Failed, Cancelled };

const char* transfer_direction_name(TransferDirection d);
const char* transfer_state_name(TransferState s);

inline bool transfer_terminal(TransferState s) {
    return s == TransferState::Done || s == TransferState::Failed ||
           s == TransferState::Cancelled;
}

// Snapshot of one transfer.
struct TransferInfo {
    std::string transfer_id;
    std::string host_id;
    TransferDirection direction = TransferDirection::Upload;
    std::string local_path;
    std::string remote_path;
    uint64_t bytes_total = 0;
    uint64_t bytes_done = 0;      // offset reached; kept on failure
    TransferState state = TransferState::Pending;
    std::string error;
    std::string queued_at;
    std::string started_at;
    std::string finished_at;
};

struct TransferStats {
    int pending = 0;
    int running = 0;
    int done = 0;
    int failed = 0;
    int cancelled = 0;
    uint64_t bytes_transferred = 0;
    std::map<std::string, int> running_per_host;
};

// FileTransferManager: SFTP uploads/downloads over pooled connections.
//
// Transfers queue FIFO and are dispatched onto the WorkerPool while under
// both the global and per-host caps. Each runs on its own SFTP channel and
// streams in fixed-size chunks; cancellation is checked between chunks and
// leaves the partial file in place. Terminal transfers stay in history for
// the retention window, bounded per host.
class FileTransferManager {
public:
    FileTransferManager(ConnectionPool& pool, WorkerPool& workers, TransferConfig config);
    ~FileTransferManager();

    FileTransferManager(const FileTransferManager&) = delete;
    FileTransferManager& operator=(const FileTransferManager&) = delete;

    // ── Transfers ──────────────────────────────────────────────

    Result<std::string> upload_file(const HostCredential& cred, const std::string& local_path,
                                    const std::string& remote_path);
    Result<std::string> download_file(const HostCredential& cred, const std::string& remote_path,
                                      const std::string& local_path);

    Result<TransferInfo> get_transfer_progress(const std::string& transfer_id) const;

    // Pending: dequeued and Cancelled at once. Running: flagged, stops at
    // the next chunk boundary. Terminal: InvalidArgument.
    Result<void> cancel_transfer(const std::string& transfer_id);

    // Block until the transfer is terminal or timeout_ms passes (TimedOut).
    Result<TransferInfo> wait_transfer(const std::string& transfer_id, int timeout_ms);

    std::vector<TransferInfo> get_active_transfers() const;

    // Newest first. Empty host: all hosts. limit 0: no limit.
    std::vector<TransferInfo> get_transfer_history(const std::string& host_id = "",
                                                   std::size_t limit = 0) const;

    TransferStats stats() const;

    // Cancel everything and wait for running transfers to stop.
    void shutdown();

    // ── Remote filesystem ──────────────────────────────────────

    Result<std::vector<RemoteEntry>> list_directory(const HostCredential& cred,
                                                    const std::string& path);
    Result<void> create_directory(const HostCredential& cred, const std::string& path,
                                  int mode = 0755, bool recursive = false);

    // Non-recursive delete of a non-empty directory fails with NotEmpty.
    Result<void> delete_remote(const HostCredential& cred, const std::string& path,
                               bool recursive = false);

private:
    using Clock = std::chrono::steady_clock;

    struct Transfer {
        std::string id;
        uint64_t seq = 0;
        HostCredential cred;
        TransferDirection direction = TransferDirection::Upload;
        std::string local_path;
        std::string remote_path;
        std::atomic<uint64_t> bytes_total{0};
        std::atomic<uint64_t> bytes_done{0};
        std::atomic<bool> cancel{false};

        // guarded by FileTransferManager::mutex_
        TransferState state = TransferState::Pending;
        std::string error;
        std::string queued_at;
        std::string started_at;
        std::string finished_at;
        Clock::time_point finished_tp;
    };

    Result<std::string> enqueue(const HostCredential& cred, TransferDirection direction,
                                const std::string& local_path, const std::string& remote_path);

    // Start queued transfers that fit under the caps. Caller holds mutex_.
    void dispatch_locked();

    void run_transfer(const std::shared_ptr<Transfer>& t);

    // Ok(true) when the whole file moved, Ok(false) when cancelled midway.
    Result<bool> stream_upload(Transfer& t, SftpChannel& sftp);
    Result<bool> stream_download(Transfer& t, SftpChannel& sftp);
    void finish(const std::shared_ptr<Transfer>& t, TransferState state, const std::string& error);

    // Drop terminal transfers past retention or over the per-host cap. Caller holds mutex_.
    void prune_history_locked();

    TransferInfo snapshot_locked(const Transfer& t) const;

    Result<void> mkdir_recursive(SftpChannel& sftp, const std::string& path, int mode);
    Result<void> remove_tree(SftpChannel& sftp, const std::string& path);

    // Return the SFTP channel to the pool. After a failure the connection is
    // checked and degraded if it died.
    void release_sftp(PooledSftp& ps, bool failed);

    ConnectionPool& pool_;
    WorkerPool& workers_;
    TransferConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Transfer>> queue_;
    std::map<std::string, std::shared_ptr<Transfer>> transfers_;
    std::map<std::string, int> running_per_host_;
    int running_total_ = 0;
    uint64_t next_seq_ = 0;
    uint64_t bytes_transferred_ = 0;
    bool shutting_down_ = false;
};
