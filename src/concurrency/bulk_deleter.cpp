#include "bulk_deleter.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <system_error>

// ── ErrorChannel ──────────────────────────────────────────

ErrorChannel::ErrorChannel(size_t capacity) : capacity_(capacity) {
    errors_.reserve(capacity);
}

void ErrorChannel::push(std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Capacity equals the producer count and each producer pushes at most
    // once, so this only trips on misuse.
    if (errors_.size() >= capacity_) {
        knadmin_log(fmt::format("ErrorChannel: over capacity, dropped: {}", error));
        return;
    }
    errors_.push_back(std::move(error));
}

std::optional<std::string> ErrorChannel::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_pos_ >= errors_.size()) return std::nullopt;
    return errors_[read_pos_++];
}

size_t ErrorChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size() - read_pos_;
}

// ── BulkDeleter ───────────────────────────────────────────

BulkDeleter::BulkDeleter(ClusterClient& client, StatusCallback out)
    : client_(client), out_(std::move(out)) {}

void BulkDeleter::emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (out_) out_(line);
}

DeletionOutcome BulkDeleter::delete_one(const ResourceHandle& handle) {
    auto result = client_.delete_secret(handle.ns, handle.name);
    if (result.is_not_found()) {
        emit(fmt::format("Secret '{}' not found, skipped", handle.qualified()));
        return {DeletionOutcome::Kind::AlreadyAbsent, ""};
    }
    if (result.is_err()) {
        return {DeletionOutcome::Kind::Failed,
                fmt::format("failed to delete secret '{}': {}", handle.qualified(), result.error)};
    }
    emit(fmt::format("Secret '{}' deleted", handle.qualified()));
    return {DeletionOutcome::Kind::Deleted, ""};
}

Result<void> BulkDeleter::delete_all(const std::map<std::string, ResourceHandle>& handles) {
    {
        std::lock_guard<std::mutex> lock(outcomes_mutex_);
        outcomes_.clear();
    }

    ErrorChannel errors(handles.size());
    std::vector<std::thread> workers;
    workers.reserve(handles.size());

    auto record = [this, &errors](const std::string& key, DeletionOutcome outcome) {
        if (outcome.kind == DeletionOutcome::Kind::Failed) {
            knadmin_log(fmt::format("BulkDeleter: {}", outcome.reason));
            errors.push(outcome.reason);
        }
        std::lock_guard<std::mutex> lock(outcomes_mutex_);
        outcomes_[key] = std::move(outcome);
    };

    // If a thread cannot be started, the handles from that one on are
    // never attempted; each is recorded as failed.
    bool spawn_failed = false;
    std::string spawn_error;
    for (const auto& entry : handles) {
        const std::string& key = entry.first;
        const ResourceHandle& handle = entry.second;
        if (!spawn_failed) {
            try {
                workers.push_back(spawn([this, &record, &key, &handle] {
                    record(key, delete_one(handle));
                }));
                continue;
            } catch (const std::system_error& e) {
                spawn_failed = true;
                spawn_error = e.what();
            }
        }
        record(key, {DeletionOutcome::Kind::Failed,
                     fmt::format("failed to delete secret '{}': cannot start worker: {}",
                                 handle.qualified(), spawn_error)});
    }

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }

    size_t failed = errors.size();
    auto first = errors.try_receive();
    if (first) {
        if (failed > 1) {
            knadmin_log(fmt::format("BulkDeleter: {} of {} deletions failed, reporting the first",
                                    failed, handles.size()));
        }
        return Result<void>::Err(*first);
    }
    return Result<void>::Ok();
}

std::thread BulkDeleter::spawn(std::function<void()> work) {
    return std::thread(std::move(work));
}

std::map<std::string, DeletionOutcome> BulkDeleter::outcomes() const {
    std::lock_guard<std::mutex> lock(outcomes_mutex_);
    return outcomes_;
}
