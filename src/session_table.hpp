#pragma once
#include "process.hpp"
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <cstdint>

namespace gptshell {

// id -> ProcessRecord for DETACHED and INTERACTIVE processes.
//
// The table lock only guards the map itself; each record carries its own
// lock, so work on one session never serializes another.
class SessionTable {
public:
    // Returns false if the id is already present.
    bool insert(std::shared_ptr<ProcessRecord> record);

    // nullptr on a miss.
    std::shared_ptr<ProcessRecord> find(const std::string& id) const;

    // Remove a record. Returns false if absent.
    bool remove(const std::string& id);

    // Drop terminal records that finished more than max_age_seconds ago.
    // Returns the number removed.
    size_t purge_finished(uint64_t max_age_seconds, uint64_t now);

    std::vector<std::string> list_ids() const;
    std::vector<std::shared_ptr<ProcessRecord>> records() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProcessRecord>> records_;
};

} // namespace gptshell
