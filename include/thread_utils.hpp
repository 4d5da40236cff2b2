#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Multi-producer queue whose consumer blocks until an item arrives.
 */
template <typename T> class BlockingQueue {
  public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            items_.push(std::move(item));
        }
        cv_.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop();
        return item;
    }

  private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<T> items_;
};

/**
 * @brief Owns a set of threads and joins all of them on destruction.
 */
class ThreadGroup {
  public:
    ThreadGroup() = default;
    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;
    ~ThreadGroup() { join_all(); }

    template <class Fn> void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join_all() {
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

  private:
    std::vector<std::thread> threads_;
};

#endif // THREAD_UTILS_HPP
