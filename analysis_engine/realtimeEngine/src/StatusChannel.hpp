// StatusChannel.hpp - Operator-facing status messages
//
// Free-text notices from any thread (plugin missing, transform error,
// preset fallback). Bounded: when full, the oldest message is dropped.
// The monitoring loop drains and prints them.

#pragma once

#include <deque>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

class StatusChannel {
public:
    explicit StatusChannel(size_t capacity = 256) : mCapacity(capacity > 0 ? capacity : 1) {}

    void post(std::string message) {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mMessages.size() >= mCapacity) {
            mMessages.pop_front();
            ++mDropped;
        }
        mMessages.push_back(std::move(message));
    }

    /// Take every pending message, oldest first.
    std::vector<std::string> drain() {
        std::lock_guard<std::mutex> lock(mMutex);
        std::vector<std::string> out(std::make_move_iterator(mMessages.begin()),
                                     std::make_move_iterator(mMessages.end()));
        mMessages.clear();
        return out;
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mDropped;
    }

private:
    mutable std::mutex mMutex;
    std::deque<std::string> mMessages;
    size_t mCapacity;
    size_t mDropped = 0;
};
