#include "session_table.hpp"

namespace gptshell {

bool SessionTable::insert(std::shared_ptr<ProcessRecord> record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = record->id();
    return records_.emplace(std::move(id), std::move(record)).second;
}

std::shared_ptr<ProcessRecord> SessionTable::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return nullptr;
    return it->second;
}

bool SessionTable::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) > 0;
}

size_t SessionTable::purge_finished(uint64_t max_age_seconds, uint64_t now) {
    std::vector<std::shared_ptr<ProcessRecord>> purged;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = records_.begin(); it != records_.end(); ) {
            auto& rec = it->second;
            uint64_t finished = rec->finished_at();
            if (!rec->running() && now >= finished && now - finished >= max_age_seconds) {
                purged.push_back(std::move(rec));
                it = records_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Records are destroyed here, outside the table lock.
    return purged.size();
}

std::vector<std::string> SessionTable::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, _] : records_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::shared_ptr<ProcessRecord>> SessionTable::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<ProcessRecord>> out;
    out.reserve(records_.size());
    for (const auto& [_, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

size_t SessionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace gptshell
