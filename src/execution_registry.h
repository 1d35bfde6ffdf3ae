#pragma once

#include "constants.h"
#include "execution_types.h"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

// Owns every ExecutionHandle. All transitions happen under one mutex, so a
// summary is never observed half-updated. Live entries are kept until they
// reach a terminal status; terminal entries are retained up to a bound.
class ExecutionRegistry {
public:
    explicit ExecutionRegistry(size_t retained_terminal = DEFAULT_RETAINED_EXECUTIONS);

    // New Pending entry; returns its unique id ("exec_<16 hex>")
    std::string create(const ExecutionRequest& request);

    // Pending -> Running. False if the entry is unknown, not Pending, or a
    // cancellation was requested before the unit started.
    bool mark_running(const std::string& execution_id);

    // Live -> terminal. False if unknown or already terminal.
    bool finish(const std::string& execution_id, ExecutionStatus status);

    // Requests cancellation of a live execution. True only for the first
    // request against a live entry.
    bool cancel(const std::string& execution_id);
    bool cancel_requested(const std::string& execution_id) const;

    std::optional<ExecutionSummary> get(const std::string& execution_id) const;

    // Oldest first
    std::vector<ExecutionSummary> list() const;

    size_t live_count() const;

private:
    struct Entry {
        ExecutionSummary summary;
        bool cancel_requested = false;
    };

    void evict_terminal();

    size_t retained_terminal_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::deque<std::string> terminal_order_;
};

} // namespace runbox
