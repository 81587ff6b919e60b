// RingBuffer.hpp - Bounded history of recent samples
//
// Fixed-capacity circular store written by the generator thread and read by
// the analysis thread (and the exporters on shutdown).
//
// STATE:
//   storage  - capacity C floats
//   cursor   - next write position, in [0, C)
//   filled   - valid samples, in [0, C]
//
// INVARIANT: the most recent min(filled, C) appended samples are recoverable
// in arrival order through getLast(). Overflow silently discards the oldest.
//
// THREADING:
// - One mutex around every operation. append() and getLast() are O(n)
//   memcpy-sized sections and never block on I/O.
// - resize() is used when the sample rate changes: capacity changes in
//   place, history is discarded, and existing references stay valid.
// - The buffer can carry the sample rate its contents were produced at.
//   append(samples, fs) rejects data from any other rate, so a chunk that
//   was generated just before a rate change cannot land after the resize.
//   A rate of 0 means untagged: every append is accepted.

#pragma once

#include <algorithm>
#include <cstring>
#include <mutex>
#include <vector>

class RingBuffer {
public:
    explicit RingBuffer(size_t capacity, double sampleRate = 0.0)
        : mStorage(std::max<size_t>(capacity, 1), 0.0f), mSampleRate(sampleRate) {}

    void clear() {
        std::lock_guard<std::mutex> lock(mMutex);
        std::fill(mStorage.begin(), mStorage.end(), 0.0f);
        mCursor = 0;
        mFilled = 0;
    }

    /// Change capacity and rate tag, and drop all history.
    void resize(size_t capacity, double sampleRate = 0.0) {
        std::lock_guard<std::mutex> lock(mMutex);
        mStorage.assign(std::max<size_t>(capacity, 1), 0.0f);
        mSampleRate = sampleRate;
        mCursor = 0;
        mFilled = 0;
    }

    void append(const float* data, size_t n) {
        if (n == 0) return;
        std::lock_guard<std::mutex> lock(mMutex);
        write(data, n);
    }

    void append(const std::vector<float>& samples) {
        append(samples.data(), samples.size());
    }

    /// Append only if `sampleRate` matches the buffer's tag (or the buffer is
    /// untagged). Returns false if the samples were discarded.
    bool append(const std::vector<float>& samples, double sampleRate) {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mSampleRate > 0.0 && sampleRate != mSampleRate) return false;
        if (!samples.empty()) write(samples.data(), samples.size());
        return true;
    }

    /// Most recent min(n, filled) samples, oldest first.
    std::vector<float> getLast(size_t n) const {
        std::lock_guard<std::mutex> lock(mMutex);
        n = std::min(n, mFilled);
        std::vector<float> out(n);
        if (n == 0) return out;

        const size_t cap = mStorage.size();
        if (n <= mCursor) {
            // Contiguous slice ending at the cursor
            std::memcpy(out.data(), mStorage.data() + (mCursor - n), n * sizeof(float));
        } else {
            // Crosses the wrap point: tail of storage, then head
            size_t tail = n - mCursor;
            std::memcpy(out.data(), mStorage.data() + (cap - tail), tail * sizeof(float));
            std::memcpy(out.data() + tail, mStorage.data(), mCursor * sizeof(float));
        }
        return out;
    }

    size_t capacity() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mStorage.size();
    }

    size_t filled() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mFilled;
    }

    double sampleRate() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mSampleRate;
    }

private:
    // Caller holds mMutex; n > 0.
    void write(const float* data, size_t n) {
        const size_t cap = mStorage.size();

        if (n >= cap) {
            // Only the newest `cap` samples survive.
            std::memcpy(mStorage.data(), data + (n - cap), cap * sizeof(float));
            mCursor = 0;
            mFilled = cap;
            return;
        }

        size_t head = std::min(n, cap - mCursor);
        std::memcpy(mStorage.data() + mCursor, data, head * sizeof(float));
        if (head < n) {
            std::memcpy(mStorage.data(), data + head, (n - head) * sizeof(float));
        }
        mCursor = (mCursor + n) % cap;
        mFilled = std::min(cap, mFilled + n);
    }

    mutable std::mutex mMutex;
    std::vector<float> mStorage;
    size_t mCursor = 0;
    size_t mFilled = 0;
    double mSampleRate = 0.0;
};
