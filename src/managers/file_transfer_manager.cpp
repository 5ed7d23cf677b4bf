#include "file_transfer_manager.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

bool connection_suspect(ErrorKind kind) {
    return kind == ErrorKind::ConnectionError || kind == ErrorKind::ConnectionLost ||
           kind == ErrorKind::TimedOut;
}

}  // namespace

const char* transfer_direction_name(TransferDirection d) {
    return d == TransferDirection::Upload ? "upload" : "download";
}

const char* transfer_state_name(TransferState s) {
    switch (s) {
        case TransferState::Pending:   return "pending";
        case TransferState::Running:   return "running";
        case TransferState::Done:      return "done";
        case TransferState::Failed:    return "failed";
        case TransferState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ── Construction / Destruction ──────────────────────────────

FileTransferManager::FileTransferManager(ConnectionPool& pool, WorkerPool& workers,
                                         TransferConfig config)
    : pool_(pool), workers_(workers), config_(std::move(config)) {
    if (config_.max_global < 1) config_.max_global = 1;
    if (config_.max_per_host < 1) config_.max_per_host = 1;
    if (config_.chunk_size == 0) config_.chunk_size = TRANSFER_CHUNK_SIZE;
}

FileTransferManager::~FileTransferManager() {
    shutdown();
}

void FileTransferManager::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!shutting_down_) {
        shutting_down_ = true;
        for (auto& t : queue_) {
            t->state = TransferState::Cancelled;
            t->error = "shutdown";
            t->finished_at = now_iso();
            t->finished_tp = Clock::now();
        }
        queue_.clear();
        for (auto& [id, t] : transfers_) {
            if (t->state == TransferState::Running) t->cancel = true;
        }
    }
    cv_.wait(lock, [this] { return running_total_ == 0; });
}

// ── Queueing ────────────────────────────────────────────────

Result<std::string> FileTransferManager::upload_file(const HostCredential& cred,
                                                     const std::string& local_path,
                                                     const std::string& remote_path) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return Result<std::string>::Err(ErrorKind::NotFound, "Local file not found: " + local_path);
    }
    return enqueue(cred, TransferDirection::Upload, local_path, remote_path);
}

Result<std::string> FileTransferManager::download_file(const HostCredential& cred,
                                                       const std::string& remote_path,
                                                       const std::string& local_path) {
    return enqueue(cred, TransferDirection::Download, local_path, remote_path);
}

Result<std::string> FileTransferManager::enqueue(const HostCredential& cred,
                                                 TransferDirection direction,
                                                 const std::string& local_path,
                                                 const std::string& remote_path) {
    if (local_path.empty() || remote_path.empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidArgument, "Transfer paths must not be empty");
    }

    auto t = std::make_shared<Transfer>();
    t->id = random_id();
    t->cred = cred;
    t->direction = direction;
    t->local_path = local_path;
    t->remote_path = remote_path;
    t->queued_at = now_iso();
    if (direction == TransferDirection::Upload) {
        std::error_code ec;
        auto size = fs::file_size(local_path, ec);
        if (!ec) t->bytes_total = size;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        return Result<std::string>::Err(ErrorKind::CapacityExceeded, "Transfer manager is shutting down");
    }
    t->seq = next_seq_++;
    transfers_[t->id] = t;
    queue_.push_back(t);
    fleet_log(fmt::format("transfer {}: queued {} {} -> {} on {}", t->id,
                          transfer_direction_name(direction), local_path, remote_path, cred.host_id));
    dispatch_locked();
    return Result<std::string>::Ok(t->id);
}

void FileTransferManager::dispatch_locked() {
    if (shutting_down_) return;

    for (auto it = queue_.begin(); it != queue_.end() && running_total_ < config_.max_global;) {
        auto t = *it;
        const std::string& host = t->cred.host_id;
        auto rh = running_per_host_.find(host);
        if (rh != running_per_host_.end() && rh->second >= config_.max_per_host) {
            ++it;
            continue;
        }

        it = queue_.erase(it);
        t->state = TransferState::Running;
        t->started_at = now_iso();
        running_total_++;
        running_per_host_[host]++;

        if (!workers_.submit([this, t] { run_transfer(t); })) {
            running_total_--;
            if (--running_per_host_[host] == 0) running_per_host_.erase(host);
            t->state = TransferState::Failed;
            t->error = "worker pool stopped";
            t->finished_at = now_iso();
            t->finished_tp = Clock::now();
            cv_.notify_all();
        }
    }
}

// ── Execution ───────────────────────────────────────────────

void FileTransferManager::run_transfer(const std::shared_ptr<Transfer>& t) {
    if (t->cancel) {
        finish(t, TransferState::Cancelled, "cancelled");
        return;
    }

    auto ps = pool_.open_sftp(t->cred, config_.op_timeout_secs * 1000);
    if (ps.is_err()) {
        fleet_log_error("transfer " + t->id, ps);
        finish(t, TransferState::Failed, ps.error);
        return;
    }

    auto r = t->direction == TransferDirection::Upload
        ? stream_upload(*t, *ps.value.sftp)
        : stream_download(*t, *ps.value.sftp);
    release_sftp(ps.value, r.is_err() && connection_suspect(r.kind));

    if (r.is_err()) {
        fleet_log_error("transfer " + t->id, r);
        finish(t, TransferState::Failed, r.error);
    } else if (!r.value) {
        finish(t, TransferState::Cancelled, "cancelled");
    } else {
        finish(t, TransferState::Done, "");
    }
}

Result<bool> FileTransferManager::stream_upload(Transfer& t, SftpChannel& sftp) {
    std::ifstream in(t.local_path, std::ios::binary);
    if (!in) {
        return Result<bool>::Err(ErrorKind::TransferError, "Cannot open local file " + t.local_path);
    }

    auto remote = sftp.open_write(t.remote_path, 0644);
    if (remote.is_err()) {
        return Result<bool>::Err(ErrorKind::TransferError,
                                 "Cannot open " + t.remote_path + ": " + remote.error);
    }
    auto& file = *remote.value;

    std::vector<char> buf(config_.chunk_size);
    while (true) {
        if (t.cancel) {
            file.close();
            return Result<bool>::Ok(false);
        }

        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;

        ssize_t written = file.write(buf.data(), static_cast<std::size_t>(n));
        if (written != n) {
            file.close();
            return Result<bool>::Err(ErrorKind::TransferError,
                                     fmt::format("Write to {} failed at offset {}",
                                                 t.remote_path, t.bytes_done.load()));
        }
        t.bytes_done += static_cast<uint64_t>(n);
    }

    file.close();
    return Result<bool>::Ok(true);
}

Result<bool> FileTransferManager::stream_download(Transfer& t, SftpChannel& sftp) {
    auto st = sftp.stat(t.remote_path);
    if (st.is_err()) {
        return Result<bool>::Err(st.kind == ErrorKind::NotFound ? ErrorKind::NotFound
                                                                : ErrorKind::TransferError,
                                 "Cannot stat " + t.remote_path + ": " + st.error);
    }
    if (st.value.is_dir) {
        return Result<bool>::Err(ErrorKind::InvalidArgument, t.remote_path + " is a directory");
    }
    t.bytes_total = st.value.size;

    auto remote = sftp.open_read(t.remote_path);
    if (remote.is_err()) {
        return Result<bool>::Err(ErrorKind::TransferError,
                                 "Cannot open " + t.remote_path + ": " + remote.error);
    }
    auto& file = *remote.value;

    fs::path local(t.local_path);
    std::error_code ec;
    if (local.has_parent_path()) fs::create_directories(local.parent_path(), ec);
    std::ofstream out(t.local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        file.close();
        return Result<bool>::Err(ErrorKind::TransferError, "Cannot write local file " + t.local_path);
    }

    std::vector<char> buf(config_.chunk_size);
    while (true) {
        if (t.cancel) {
            file.close();
            return Result<bool>::Ok(false);
        }

        ssize_t n = file.read(buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            file.close();
            return Result<bool>::Err(ErrorKind::TransferError,
                                     fmt::format("Read from {} failed at offset {}",
                                                 t.remote_path, t.bytes_done.load()));
        }

        out.write(buf.data(), n);
        if (!out) {
            file.close();
            return Result<bool>::Err(ErrorKind::TransferError,
                                     "Write to local file " + t.local_path + " failed");
        }
        t.bytes_done += static_cast<uint64_t>(n);
    }

    file.close();
    return Result<bool>::Ok(true);
}

void FileTransferManager::finish(const std::shared_ptr<Transfer>& t, TransferState state,
                                 const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    t->state = state;
    t->error = error;
    t->finished_at = now_iso();
    t->finished_tp = Clock::now();

    running_total_--;
    auto rh = running_per_host_.find(t->cred.host_id);
    if (rh != running_per_host_.end() && --rh->second <= 0) running_per_host_.erase(rh);
    bytes_transferred_ += t->bytes_done;

    fleet_log(fmt::format("transfer {}: {} ({}/{} bytes){}", t->id, transfer_state_name(state),
                          t->bytes_done.load(), t->bytes_total.load(),
                          error.empty() ? "" : " " + error));

    prune_history_locked();
    dispatch_locked();
    cv_.notify_all();
}

void FileTransferManager::release_sftp(PooledSftp& ps, bool failed) {
    if (ps.sftp) {
        ps.sftp->close();
        ps.sftp.reset();
    }
    if (failed && ps.lease.valid() && !ps.lease.transport->check_alive()) {
        pool_.mark_degraded(ps.lease);
    }
    pool_.release(ps.lease);
}

// ── Progress and history ────────────────────────────────────

TransferInfo FileTransferManager::snapshot_locked(const Transfer& t) const {
    TransferInfo info;
    info.transfer_id = t.id;
    info.host_id = t.cred.host_id;
    info.direction = t.direction;
    info.local_path = t.local_path;
    info.remote_path = t.remote_path;
    info.bytes_total = t.bytes_total;
    info.bytes_done = t.bytes_done;
    info.state = t.state;
    info.error = t.error;
    info.queued_at = t.queued_at;
    info.started_at = t.started_at;
    info.finished_at = t.finished_at;
    return info;
}

Result<TransferInfo> FileTransferManager::get_transfer_progress(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return Result<TransferInfo>::Err(ErrorKind::NotFound, "Unknown transfer: " + transfer_id);
    }
    return Result<TransferInfo>::Ok(snapshot_locked(*it->second));
}

Result<void> FileTransferManager::cancel_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Unknown transfer: " + transfer_id);
    }
    auto t = it->second;

    switch (t->state) {
        case TransferState::Pending:
            queue_.erase(std::remove(queue_.begin(), queue_.end(), t), queue_.end());
            t->state = TransferState::Cancelled;
            t->error = "cancelled";
            t->finished_at = now_iso();
            t->finished_tp = Clock::now();
            cv_.notify_all();
            break;
        case TransferState::Running:
            t->cancel = true;
            break;
        default:
            return Result<void>::Err(ErrorKind::InvalidArgument,
                                     fmt::format("Transfer {} already {}", transfer_id,
                                                 transfer_state_name(t->state)));
    }
    fleet_log(fmt::format("transfer {}: cancel requested", transfer_id));
    return Result<void>::Ok();
}

Result<TransferInfo> FileTransferManager::wait_transfer(const std::string& transfer_id,
                                                        int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return Result<TransferInfo>::Err(ErrorKind::NotFound, "Unknown transfer: " + transfer_id);
    }
    auto t = it->second;

    bool done = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [&] { return transfer_terminal(t->state); });
    if (!done) {
        return Result<TransferInfo>::Err(ErrorKind::TimedOut,
                                         "Transfer " + transfer_id + " still in progress");
    }
    return Result<TransferInfo>::Ok(snapshot_locked(*t));
}

std::vector<TransferInfo> FileTransferManager::get_active_transfers() const {
    std::vector<std::shared_ptr<Transfer>> active;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, t] : transfers_) {
        if (!transfer_terminal(t->state)) active.push_back(t);
    }
    std::sort(active.begin(), active.end(),
              [](const auto& a, const auto& b) { return a->seq < b->seq; });

    std::vector<TransferInfo> out;
    for (const auto& t : active) out.push_back(snapshot_locked(*t));
    return out;
}

std::vector<TransferInfo> FileTransferManager::get_transfer_history(const std::string& host_id,
                                                                    std::size_t limit) const {
    std::vector<std::shared_ptr<Transfer>> done;
    auto now = Clock::now();
    auto retention = std::chrono::seconds(config_.retention_secs);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, t] : transfers_) {
        if (!transfer_terminal(t->state)) continue;
        if (!host_id.empty() && t->cred.host_id != host_id) continue;
        // Pruning only runs when a transfer finishes; expired entries may still be held
        if (now - t->finished_tp > retention) continue;
        done.push_back(t);
    }
    std::sort(done.begin(), done.end(), [](const auto& a, const auto& b) {
        if (a->finished_tp != b->finished_tp) return a->finished_tp > b->finished_tp;
        return a->seq > b->seq;
    });
    if (limit > 0 && done.size() > limit) done.resize(limit);

    std::vector<TransferInfo> out;
    for (const auto& t : done) out.push_back(snapshot_locked(*t));
    return out;
}

void FileTransferManager::prune_history_locked() {
    auto now = Clock::now();
    auto retention = std::chrono::seconds(config_.retention_secs);

    std::map<std::string, std::vector<std::shared_ptr<Transfer>>> by_host;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        const auto& t = it->second;
        if (transfer_terminal(t->state) && now - t->finished_tp > retention) {
            it = transfers_.erase(it);
            continue;
        }
        if (transfer_terminal(t->state)) by_host[t->cred.host_id].push_back(t);
        ++it;
    }

    std::size_t cap = static_cast<std::size_t>(std::max(config_.history_per_host, 0));
    for (auto& [host, list] : by_host) {
        if (list.size() <= cap) continue;
        std::sort(list.begin(), list.end(),
                  [](const auto& a, const auto& b) { return a->seq < b->seq; });
        for (std::size_t i = 0; i < list.size() - cap; i++) {
            transfers_.erase(list[i]->id);
        }
    }
}

TransferStats FileTransferManager::stats() const {
    TransferStats st;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, t] : transfers_) {
        switch (t->state) {
            case TransferState::Pending:   st.pending++; break;
            case TransferState::Running:   st.running++; break;
            case TransferState::Done:      st.done++; break;
            case TransferState::Failed:    st.failed++; break;
            case TransferState::Cancelled: st.cancelled++; break;
        }
    }
    st.bytes_transferred = bytes_transferred_;
    st.running_per_host = running_per_host_;
    return st;
}

// ── Remote filesystem ───────────────────────────────────────

Result<std::vector<RemoteEntry>> FileTransferManager::list_directory(const HostCredential& cred,
                                                                     const std::string& path) {
    auto ps = pool_.open_sftp(cred, config_.op_timeout_secs * 1000);
    if (ps.is_err()) return Result<std::vector<RemoteEntry>>::From(ps);

    auto r = ps.value.sftp->list(path);
    release_sftp(ps.value, r.is_err() && connection_suspect(r.kind));
    if (r.is_ok()) {
        std::sort(r.value.begin(), r.value.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
            if (a.is_dir != b.is_dir) return a.is_dir;
            return a.name < b.name;
        });
    }
    return r;
}

Result<void> FileTransferManager::create_directory(const HostCredential& cred,
                                                   const std::string& path, int mode,
                                                   bool recursive) {
    if (path.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Directory path is empty");
    }
    auto ps = pool_.open_sftp(cred, config_.op_timeout_secs * 1000);
    if (ps.is_err()) return Result<void>::From(ps);

    auto r = recursive ? mkdir_recursive(*ps.value.sftp, path, mode)
                       : ps.value.sftp->mkdir(path, mode);
    release_sftp(ps.value, r.is_err() && connection_suspect(r.kind));
    return r;
}

Result<void> FileTransferManager::mkdir_recursive(SftpChannel& sftp, const std::string& path,
                                                  int mode) {
    std::string prefix = path[0] == '/' ? "/" : "";
    for (const auto& part : split(path, '/')) {
        if (part.empty()) continue;
        if (!prefix.empty() && prefix.back() != '/') prefix += "/";
        prefix += part;

        auto st = sftp.stat(prefix);
        if (st.is_ok()) {
            if (!st.value.is_dir) {
                return Result<void>::Err(ErrorKind::InvalidArgument, prefix + " exists and is not a directory");
            }
            continue;
        }
        if (st.kind != ErrorKind::NotFound) return Result<void>::From(st);

        auto made = sftp.mkdir(prefix, mode);
        if (made.is_err()) return made;
    }
    return Result<void>::Ok();
}

Result<void> FileTransferManager::delete_remote(const HostCredential& cred,
                                                const std::string& path, bool recursive) {
    if (path.empty() || path == "/") {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Refusing to delete '" + path + "'");
    }
    auto ps = pool_.open_sftp(cred, config_.op_timeout_secs * 1000);
    if (ps.is_err()) return Result<void>::From(ps);
    auto& sftp = *ps.value.sftp;

    // lstat: a symlink to a directory is removed as a link, its target is untouched
    Result<void> r = Result<void>::Ok();
    auto st = sftp.lstat(path);
    if (st.is_err()) {
        r = Result<void>::From(st);
    } else if (!st.value.is_dir || st.value.is_link) {
        r = sftp.unlink(path);
    } else if (recursive) {
        r = remove_tree(sftp, path);
    } else {
        auto entries = sftp.list(path);
        if (entries.is_err()) {
            r = Result<void>::From(entries);
        } else if (!entries.value.empty()) {
            r = Result<void>::Err(ErrorKind::NotEmpty,
                                  fmt::format("Directory {} is not empty ({} entries)",
                                              path, entries.value.size()));
        } else {
            r = sftp.rmdir(path);
        }
    }

    release_sftp(ps.value, r.is_err() && connection_suspect(r.kind));
    if (r.is_ok()) fleet_log(fmt::format("sftp: deleted {} on {}", path, cred.host_id));
    return r;
}

Result<void> FileTransferManager::remove_tree(SftpChannel& sftp, const std::string& path) {
    auto entries = sftp.list(path);
    if (entries.is_err()) return Result<void>::From(entries);

    for (const auto& e : entries.value) {
        std::string child = path.back() == '/' ? path + e.name : path + "/" + e.name;
        bool descend = e.is_dir && !e.is_link;
        auto r = descend ? remove_tree(sftp, child) : sftp.unlink(child);
        if (r.is_err()) return r;
    }
    return sftp.rmdir(path);
}
