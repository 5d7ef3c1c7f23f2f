#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <utility>

// Many producers, one consumer that takes everything pending at once.
template<typename T>
class ThreadSafeQueue {
public:
    void Push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.push_back(std::move(item));
        }
        cv.notify_one();
    }

    // Blocks until something is pending, then moves all of it into out
    // (oldest first). Returns false once closed and empty.
    bool WaitPopAll(std::deque<T>& out) {
        out.clear();
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return !pending.empty() || closed; });

        if (pending.empty())
            return false;

        out.swap(pending);
        return true;
    }

    // Wakes the consumer; items already pushed are still handed out.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    void Reopen() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = false;
    }

private:
    std::deque<T> pending;
    std::mutex mutex;
    std::condition_variable cv;
    bool closed = false;
};
