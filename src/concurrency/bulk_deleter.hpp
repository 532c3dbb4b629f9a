#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <functional>
#include <vector>
#include <core/types.hpp>
#include <cluster/cluster_client.hpp>
#include <cluster/resources.hpp>

// Per-handle result of a bulk delete.
struct DeletionOutcome {
    enum class Kind { Deleted, AlreadyAbsent, Failed };

    Kind kind = Kind::Deleted;
    std::string reason;   // set when kind == Failed
};

// Fixed-capacity error channel: every producer gets a slot, so push()
// never blocks, and the consumer takes at most one error after the join.
class ErrorChannel {
public:
    explicit ErrorChannel(size_t capacity);

    void push(std::string error);

    // Non-blocking receive of the first queued error, if any.
    std::optional<std::string> try_receive();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> errors_;
    size_t capacity_;
    size_t read_pos_ = 0;
};

// Deletes a set of secrets in parallel: one thread per handle, full join
// before returning. A NotFound from the store counts as success. The
// first hard failure (if any) becomes the returned error; the others are
// only logged.
class BulkDeleter {
public:
    BulkDeleter(ClusterClient& client, StatusCallback out);
    virtual ~BulkDeleter() = default;

    Result<void> delete_all(const std::map<std::string, ResourceHandle>& handles);

    // Outcome of each handle from the last delete_all(), keyed by name.
    std::map<std::string, DeletionOutcome> outcomes() const;

protected:
    // Starts one worker; throws std::system_error when no thread is available.
    virtual std::thread spawn(std::function<void()> work);

private:
    DeletionOutcome delete_one(const ResourceHandle& handle);
    void emit(const std::string& line);

    ClusterClient& client_;
    StatusCallback out_;
    std::mutex out_mutex_;

    mutable std::mutex outcomes_mutex_;
    std::map<std::string, DeletionOutcome> outcomes_;
};
