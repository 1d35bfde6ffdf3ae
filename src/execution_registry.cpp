#include "execution_registry.h"
#include "file_utils.h"
#include <algorithm>

namespace runbox {

ExecutionRegistry::ExecutionRegistry(size_t retained_terminal)
    : retained_terminal_(retained_terminal) {}

std::string ExecutionRegistry::create(const ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id;
    do {
        id = "exec_" + FileUtils::random_hex(8);
    } while (entries_.count(id) > 0);

    Entry entry;
    entry.summary.execution_id = id;
    entry.summary.status = ExecutionStatus::Pending;
    entry.summary.started_at = std::chrono::system_clock::now();
    entry.summary.language = request.language;
    entry.summary.session = request.session;
    entry.summary.file_name = request.file_name;
    entries_.emplace(id, std::move(entry));
    return id;
}

bool ExecutionRegistry::mark_running(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    if (it == entries_.end() || it->second.summary.status != ExecutionStatus::Pending ||
        it->second.cancel_requested) {
        return false;
    }
    it->second.summary.status = ExecutionStatus::Running;
    return true;
}

bool ExecutionRegistry::finish(const std::string& execution_id, ExecutionStatus status) {
    if (!is_terminal(status)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    if (it == entries_.end() || is_terminal(it->second.summary.status)) {
        return false;
    }
    it->second.summary.status = status;
    terminal_order_.push_back(execution_id);
    evict_terminal();
    return true;
}

void ExecutionRegistry::evict_terminal() {
    while (terminal_order_.size() > retained_terminal_) {
        entries_.erase(terminal_order_.front());
        terminal_order_.pop_front();
    }
}

bool ExecutionRegistry::cancel(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    if (it == entries_.end() || is_terminal(it->second.summary.status) ||
        it->second.cancel_requested) {
        return false;
    }
    it->second.cancel_requested = true;
    return true;
}

bool ExecutionRegistry::cancel_requested(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    return it != entries_.end() && it->second.cancel_requested;
}

std::optional<ExecutionSummary> ExecutionRegistry::get(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(execution_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.summary;
}

std::vector<ExecutionSummary> ExecutionRegistry::list() const {
    std::vector<ExecutionSummary> summaries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            summaries.push_back(entry.summary);
        }
    }
    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const ExecutionSummary& a, const ExecutionSummary& b) {
                         return a.started_at < b.started_at;
                     });
    return summaries;
}

size_t ExecutionRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [](const auto& kv) {
        return !is_terminal(kv.second.summary.status);
    }));
}

} // namespace runbox
