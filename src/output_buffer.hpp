#pragma once
#include <string>
#include <mutex>
#include <cstddef>
#include <cstdint>

namespace gptshell {

constexpr size_t kDefaultBufferCapacity = 1024 * 1024;

// Append-only byte accumulator with an implicit read cursor.
//
// Offsets are absolute: byte N is the Nth byte ever appended. The buffer keeps
// at most `capacity` bytes of history (0 = unbounded); older bytes are dropped
// and a reader that falls behind the retained window is told how much it lost.
// append() and the read calls are mutually exclusive.
class OutputBuffer {
public:
    struct Chunk {
        std::string data;
        uint64_t next_offset = 0;  // pass back as the next explicit offset
        uint64_t dropped = 0;      // bytes lost to truncation before data
    };

    explicit OutputBuffer(size_t capacity = kDefaultBufferCapacity);

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    void append(const char* data, size_t len);
    void append(const std::string& data) { append(data.data(), data.size()); }

    // Everything appended since the previous drain, then advance the cursor.
    std::string drain();

    // Same as drain() but reports the cursor position and truncation.
    Chunk drain_chunk();

    // Read from an explicit absolute offset. Does not move the implicit cursor.
    Chunk read_from(uint64_t offset) const;

    uint64_t total_appended() const;
    uint64_t cursor() const;
    size_t retained() const;
    size_t capacity() const { return capacity_; }

private:
    Chunk read_locked(uint64_t offset) const;

    mutable std::mutex mutex_;
    std::string data_;
    uint64_t base_offset_ = 0;  // absolute offset of data_[0]
    uint64_t cursor_ = 0;
    size_t capacity_;
};

// Marker inserted in front of a delta when the reader lost bytes.
std::string truncation_marker(uint64_t dropped);

} // namespace gptshell
