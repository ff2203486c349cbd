#include "rlscript/logging.hpp"

#include <utility>

namespace rlscript {

memory_log_sink::memory_log_sink(std::size_t capacity_records) : capacity_(capacity_records) {
    records_.reserve(capacity_);
}

void memory_log_sink::write(const log_record& rec) {
    std::lock_guard<std::mutex> lock(mutex_);

    log_record copy = rec;
    copy.sequence = ++sequence_;

    if (capacity_ == 0) {
        return;
    }

    if (records_.size() == capacity_) {
        records_.erase(records_.begin());
    }
    records_.push_back(std::move(copy));
}

std::vector<log_record> memory_log_sink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t memory_log_sink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t memory_log_sink::capacity() const {
    return capacity_;
}

void memory_log_sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

stream_log_sink::stream_log_sink(std::ostream& out) : out_(out) {}

void stream_log_sink::write(const log_record& rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sequence_;
    out_ << '[' << log_level_name(rec.level) << "] #" << sequence_ << ' ' << rec.category;
    if (rec.call_depth > 0) {
        out_ << " depth=" << rec.call_depth;
    }
    out_ << ": " << rec.message << '\n';
}

const char* log_level_name(log_level level) noexcept {
    switch (level) {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
    }
    return "unknown";
}

}  // namespace rlscript
