#pragma once
/**
 * @file
 * @brief Thread utilities.
 * @author HOSHINO Takashi
 *
 * (C) 2013 Cybozu Labs, Inc.
 */
#include <thread>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <map>
#include <exception>
#include <functional>
#include <vector>
#include <cstdint>
#include <type_traits>
#include "util.hpp"

/**
 * Thread utilities.
 *
 * ThreadRunner runs a functor on a new thread.
 * An exception thrown in the functor will be thrown again by join().
 *
 * BoundedQueue is a blocking FIFO between threads.
 *
 * ParallelConverter converts items with worker threads
 * and gives the results in the order they were pushed.
 * convertInOrder() wraps it for a whole vector of items.
 */
namespace dfcmpr {
namespace thread {

/**
 * Thread runner.
 * This is not thread-safe.
 */
class ThreadRunner /* final */
{
private:
    std::function<void()> func_;
    std::exception_ptr ep_;
    std::unique_ptr<std::thread> threadP_;

    void run() noexcept {
        try {
            func_();
        } catch (...) {
            ep_ = std::current_exception();
        }
    }
public:
    ThreadRunner() {}
    template <typename Func>
    explicit ThreadRunner(Func&& func)
        : func_(std::forward<Func>(func)), ep_(), threadP_() {
    }
    DISABLE_COPY_AND_ASSIGN(ThreadRunner);
    ~ThreadRunner() noexcept {
        joinNoThrow();
    }
    void start() {
        if (threadP_) throw std::runtime_error("ThreadRunner: already started");
        if (!func_) throw std::runtime_error("ThreadRunner: no functor");
        ep_ = nullptr;
        threadP_.reset(new std::thread([this]() { run(); }));
    }
    /**
     * Wait for the thread done.
     * You will get an exception thrown in the thread running.
     */
    void join() {
        if (!threadP_) return;
        std::unique_ptr<std::thread> tp = std::move(threadP_);
        tp->join();
        std::exception_ptr ep = ep_;
        ep_ = nullptr;
        if (ep) std::rethrow_exception(ep);
    }
    /**
     * Nothrow version of join().
     * Instead, you will get an exception pointer.
     */
    std::exception_ptr joinNoThrow() noexcept {
        std::exception_ptr ep;
        try {
            join();
        } catch (...) {
            ep = std::current_exception();
        }
        return ep;
    }
    bool isAlive() const {
        return bool(threadP_);
    }
};

class ClosedError : public std::exception {
public:
    const char *what() const noexcept override { return "ClosedError"; }
};

class FailedError : public std::exception {
public:
    const char *what() const noexcept override { return "FailedError"; }
};

/**
 * Thread-safe bounded queue.
 * T must be movable.
 *
 * Use the pattern:
 *   T t; while (q.pop(t)) { use(t); }
 */
template <typename T>
class BoundedQueue /* final */
{
private:
    static_assert(std::is_move_assignable<T>::value &&
                  std::is_move_constructible<T>::value,
                  "T is not movable.");

    size_t size_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condEmpty_;
    std::condition_variable condFull_;
    bool isClosed_;
    bool isFailed_;

    using AutoLock = std::unique_lock<std::mutex>;

public:
    /**
     * @size queue size.
     */
    explicit BoundedQueue(size_t size = 2)
        : size_(size)
        , queue_()
        , mutex_()
        , condEmpty_()
        , condFull_()
        , isClosed_(false)
        , isFailed_(false) {
        verifySize();
    }
    DISABLE_COPY_AND_ASSIGN(BoundedQueue);

    void resize(size_t size) {
        AutoLock lk(mutex_);
        size_ = size;
        verifySize();
    }
    /**
     * Push an item.
     * This may block if the queue is full.
     */
    void push(T &&t) {
        AutoLock lk(mutex_);
        verifyFailed();
        if (isClosed_) throw ClosedError();
        while (!isFailed_ && !isClosed_ && isFull()) condFull_.wait(lk);
        verifyFailed();
        if (isClosed_) throw ClosedError();

        const bool isEmpty0 = queue_.empty();
        queue_.push(std::move(t));
        if (isEmpty0) condEmpty_.notify_all();
    }
    /**
     * Pop an item.
     * This may block if the queue is empty.
     * RETURN:
     *   true if pop succeeded, false if the queue has been synced and emptied.
     */
    bool pop(T &t) {
        AutoLock lk(mutex_);
        verifyFailed();
        while (!isFailed_ && !isClosed_ && queue_.empty()) condEmpty_.wait(lk);
        verifyFailed();
        if (isClosed_ && queue_.empty()) return false;

        const bool isFull0 = isFull();
        t = std::move(queue_.front());
        queue_.pop();
        if (isFull0) condFull_.notify_all();
        return true;
    }
    /**
     * You must call this when you have no more items to push.
     * After calling this, push() will fail.
     * The pop() will not fail until queue will be empty.
     */
    void sync() {
        AutoLock lk(mutex_);
        verifyFailed();
        isClosed_ = true;
        condEmpty_.notify_all();
        condFull_.notify_all();
    }
    /**
     * You should call this when an error has ocurred.
     * Blocked threads will be waken up and will throw FailedError.
     */
    void fail() noexcept {
        AutoLock lk(mutex_);
        if (isFailed_) return;
        isClosed_ = true;
        isFailed_ = true;
        condEmpty_.notify_all();
        condFull_.notify_all();
    }
private:
    bool isFull() const {
        return size_ <= queue_.size();
    }
    void verifyFailed() const {
        if (isFailed_) throw FailedError();
    }
    void verifySize() const {
        if (size_ < 2) throw std::runtime_error("queue size must be more than 1.");
    }
};

inline size_t resolveConcurrency(size_t concurrency)
{
    if (concurrency != 0) return concurrency;
    const size_t n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

/**
 * Parallel converter.
 * T1 and T2 must be movable and default constructible.
 *
 * This converter holds the order of items, that is FIFO.
 * This class supports single producer and single consumer with parallel worker.
 *
 * When a converter call throws, the queues fail and
 * the exception is rethrown by the next push(), pop() or sync().
 */
template <typename T1, typename T2>
class ParallelConverter
{
    struct Src {
        uint64_t id;
        T1 t1;
    };
    struct Dst {
        uint64_t id;
        T2 t2;
    };

    std::function<T2(T1&&)> conv_;

    std::mutex pushMu_;
    uint64_t pushId_;

    std::mutex popMu_;
    uint64_t popId_;
    std::map<uint64_t, T2> map_;

    BoundedQueue<Src> inQ_;
    BoundedQueue<Dst> outQ_;

    std::mutex workerMu_;
    std::vector<std::unique_ptr<ThreadRunner> > workerV_;

    std::mutex errMu_;
    std::exception_ptr ep_;

public:
    /**
     * Converter must be function of type T2 (*)(T1&&).
     */
    template <typename Converter>
    explicit ParallelConverter(Converter&& conv)
        : conv_(std::forward<Converter>(conv))
        , pushMu_(), pushId_(0)
        , popMu_(), popId_(0), map_()
        , inQ_(2), outQ_(2)
        , workerMu_(), workerV_()
        , errMu_(), ep_() {
    }
    DISABLE_COPY_AND_ASSIGN(ParallelConverter);
    ~ParallelConverter() noexcept {
        // You called sync() before, this will not effect anything.
        fail();
    }
    void start(size_t concurrency = 0) {
        concurrency = resolveConcurrency(concurrency);
        const size_t qs = concurrency * 2;
        inQ_.resize(qs);
        outQ_.resize(qs);
        std::lock_guard<std::mutex> lock(workerMu_);
        for (size_t i = 0; i < concurrency; i++) {
            workerV_.emplace_back(new ThreadRunner([this]() { runWorker(); }));
            workerV_.back()->start();
        }
    }
    /**
     * Do not call this function from multiple threads.
     */
    void push(T1&& t1) {
        std::lock_guard<std::mutex> lock(pushMu_);
        try {
            inQ_.push(Src { pushId_, std::move(t1) });
        } catch (FailedError &) {
            rethrowWorkerError();
            throw;
        }
        pushId_++;
    }
    /**
     * Do not call this function from multiple threads.
     * RETURN:
     *   false when all the items have been popped after sync().
     */
    bool pop(T2& t2) {
        std::lock_guard<std::mutex> lock(popMu_);
        if (findInMap(popId_, t2)) {
            popId_++;
            return true;
        }
        try {
            Dst dst;
            while (outQ_.pop(dst)) {
                if (dst.id == popId_) {
                    t2 = std::move(dst.t2);
                    popId_++;
                    return true;
                }
                map_.insert(std::make_pair(dst.id, std::move(dst.t2)));
            }
        } catch (FailedError &) {
            rethrowWorkerError();
            throw;
        }
        return false;
    }
    /**
     * After calling this, push() always fails.
     */
    void sync() {
        try {
            inQ_.sync();
            joinWorkers();
            rethrowWorkerError();
            outQ_.sync();
        } catch (FailedError &) {
            rethrowWorkerError();
            throw;
        }
    }
    /**
     * This is thread-safe.
     */
    void fail() noexcept {
        inQ_.fail();
        outQ_.fail();
        joinWorkers();
    }
private:
    /**
     * Lock must be held.
     */
    bool findInMap(uint64_t id, T2& t2) {
        if (map_.empty() || id != map_.begin()->first) {
            return false;
        }
        t2 = std::move(map_.begin()->second);
        map_.erase(map_.begin());
        return true;
    }
    void joinWorkers() noexcept {
        std::lock_guard<std::mutex> lock(workerMu_);
        for (std::unique_ptr<ThreadRunner> &w : workerV_) {
            // runWorker() never throws.
            w->joinNoThrow();
        }
        workerV_.clear();
    }
    void rethrowWorkerError() {
        std::exception_ptr ep;
        {
            std::lock_guard<std::mutex> lock(errMu_);
            ep = ep_;
        }
        if (!ep) return;
        outQ_.fail();
        std::rethrow_exception(ep);
    }
    void runWorker() noexcept {
        try {
            Src src;
            Dst dst;
            while (inQ_.pop(src)) {
                dst.id = src.id;
                dst.t2 = conv_(std::move(src.t1));
                outQ_.push(std::move(dst));
            }
        } catch (FailedError &) {
            // another thread failed the queues.
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(errMu_);
                if (!ep_) ep_ = std::current_exception();
            }
            inQ_.fail();
            outQ_.fail();
        }
    }
};

/**
 * Convert all the items with concurrency threads.
 * The i-th output is conv(inV[i]).
 * If some conversions throw, the first exception is rethrown and no output is returned.
 *
 * concurrency 0 means the number of hardware threads.
 * With concurrency 1 or less than two items, conv is called on the caller thread.
 */
template <typename T1, typename T2, typename Converter>
std::vector<T2> convertInOrder(std::vector<T1>&& inV, Converter&& conv, size_t concurrency)
{
    concurrency = resolveConcurrency(concurrency);
    std::vector<T2> outV;
    outV.reserve(inV.size());
    if (concurrency == 1 || inV.size() < 2) {
        for (T1 &t1 : inV) {
            outV.push_back(conv(std::move(t1)));
        }
        return outV;
    }
    if (concurrency > inV.size()) concurrency = inV.size();

    ParallelConverter<T1, T2> pconv(std::forward<Converter>(conv));
    pconv.start(concurrency);

    ThreadRunner popper([&]() {
            try {
                T2 t2;
                while (pconv.pop(t2)) {
                    outV.push_back(std::move(t2));
                }
            } catch (...) {
                pconv.fail();
                throw;
            }
        });
    popper.start();

    try {
        for (T1 &t1 : inV) {
            pconv.push(std::move(t1));
        }
        pconv.sync();
    } catch (...) {
        pconv.fail();
        std::exception_ptr ep = popper.joinNoThrow();
        if (ep) std::rethrow_exception(ep);
        throw;
    }
    popper.join();
    return outV;
}

}} // namespace dfcmpr::thread
