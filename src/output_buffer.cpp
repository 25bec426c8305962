#include "output_buffer.hpp"

namespace gptshell {

std::string truncation_marker(uint64_t dropped) {
    return "[... " + std::to_string(dropped) + " bytes truncated ...]\n";
}

OutputBuffer::OutputBuffer(size_t capacity)
    : capacity_(capacity)
{}

void OutputBuffer::append(const char* data, size_t len) {
    if (len == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(data, len);
    if (capacity_ > 0 && data_.size() > capacity_) {
        size_t excess = data_.size() - capacity_;
        data_.erase(0, excess);
        base_offset_ += excess;
    }
}

OutputBuffer::Chunk OutputBuffer::read_locked(uint64_t offset) const {
    Chunk chunk;
    uint64_t end = base_offset_ + data_.size();
    if (offset < base_offset_) {
        chunk.dropped = base_offset_ - offset;
        offset = base_offset_;
    }
    if (offset < end) {
        chunk.data = data_.substr(static_cast<size_t>(offset - base_offset_));
    }
    chunk.next_offset = end;
    return chunk;
}

std::string OutputBuffer::drain() {
    Chunk chunk = drain_chunk();
    if (chunk.dropped > 0) {
        return truncation_marker(chunk.dropped) + chunk.data;
    }
    return std::move(chunk.data);
}

OutputBuffer::Chunk OutputBuffer::drain_chunk() {
    std::lock_guard<std::mutex> lock(mutex_);
    Chunk chunk = read_locked(cursor_);
    cursor_ = chunk.next_offset;
    return chunk;
}

OutputBuffer::Chunk OutputBuffer::read_from(uint64_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_locked(offset);
}

uint64_t OutputBuffer::total_appended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_offset_ + data_.size();
}

uint64_t OutputBuffer::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

size_t OutputBuffer::retained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

} // namespace gptshell
