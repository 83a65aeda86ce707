#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <vector>

// Per-channel sample history with a fixed capacity; the oldest samples are
// dropped once a channel is full.
class WaveformBuffer {
public:
    explicit WaveformBuffer(size_t capacity) : capacity_(capacity) {}

    void append(int channel, const std::vector<double>& samples) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& buf = channels_[channel];
        for (double s : samples) {
            buf.push_back(s);
            if (buf.size() > capacity_) buf.pop_front();
        }
    }

    std::vector<double> data(int channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(channel);
        if (it == channels_.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_.clear();
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<int, std::deque<double>> channels_;
};
