//
// Created by lewis on 4/2/24.
//

#ifndef BULK_SUBMIT_SERVER_TASKQUEUE_H
#define BULK_SUBMIT_SERVER_TASKQUEUE_H

#include "TestingMacros.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <folly/concurrency/UnboundedQueue.h>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

/*
 * Single consumer FIFO executor for cancellable tasks.
 *
 * Tasks are run one at a time, in the order they were enqueued, on a thread owned by the queue. Each task is handed
 * the stop token of the current generation. abortAll() requests stop on that token, so the running task can bail out
 * early, and abandons every task that has not started yet. Abandoned tasks are never run, their futures report
 * std::future_errc::broken_promise.
 */
template<typename T>
class TaskQueue {
public:
    using Task = std::function<T(std::stop_token)>;

    TaskQueue() = default;

    ~TaskQueue() {
        abortAll();
        clearHandlers();
    }

    TaskQueue(TaskQueue const&) = delete;
    auto operator =(TaskQueue const&) -> TaskQueue& = delete;
    TaskQueue(TaskQueue&&) = delete;
    auto operator=(TaskQueue&&) -> TaskQueue& = delete;

    auto enqueue(Task task) -> std::future<T> {
        auto item = std::make_shared<sQueueItem>();
        item->task = std::move(task);
        auto future = item->promise.get_future();

        {
            std::unique_lock<std::mutex> lock(dataCVMutex);
            item->generation = generation;
            queue.enqueue(item);

            // Trigger the new data event to start processing
            dataReady = true;
        }
        dataCV.notify_one();

        return future;
    }

    void abortAll() {
        std::unique_lock<std::mutex> lock(dataCVMutex);

        // Anything still in the queue belongs to the old generation and will be dropped by the consumer
        generation++;

        // Signal the running task, then start a fresh generation so the queue stays usable
        stopSource.request_stop();
        stopSource = std::stop_source();
    }

    // Called with the result of each task, before the task's future is fulfilled
    void setSuccessHandler(std::function<void(const T&)> handler) {
        std::unique_lock<std::mutex> lock(handlerMutex);
        successHandler = std::move(handler);
    }

    // Only called if set. The task's future receives the exception either way
    void setErrorHandler(std::function<void(std::exception_ptr)> handler) {
        std::unique_lock<std::mutex> lock(handlerMutex);
        errorHandler = std::move(handler);
    }

    // Called each time the queue has been drained
    void setIdleHandler(std::function<void()> handler) {
        std::unique_lock<std::mutex> lock(handlerMutex);
        idleHandler = std::move(handler);
    }

    void clearHandlers() {
        std::unique_lock<std::mutex> lock(handlerMutex);
        successHandler = nullptr;
        errorHandler = nullptr;
        idleHandler = nullptr;
    }

    [[nodiscard]] auto isProcessing() const -> bool {
        return bProcessing;
    }

    [[nodiscard]] auto isEmpty() const -> bool {
        return queue.empty();
    }

private:
    struct sQueueItem {
        Task task;
        std::promise<T> promise;
        uint64_t generation = 0;
    };

    void run(const std::stop_token& threadStopToken) {
        while (!threadStopToken.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(dataCVMutex);

                // Wait for tasks to be queued
                if (!dataCV.wait(lock, threadStopToken, [this] { return this->dataReady; })) {
                    return;
                }

                // Reset the condition
                this->dataReady = false;
            }

            drain(threadStopToken);
        }
    }

    void drain(const std::stop_token& threadStopToken) {
        bool hadData = false;

        while (!threadStopToken.stop_requested()) {
            // Pop the next item from the queue
            auto item = queue.try_dequeue();
            if (!item) {
                break;
            }

            hadData = true;

            std::stop_token taskStopToken;
            {
                std::unique_lock<std::mutex> lock(dataCVMutex);

                // Items from an aborted generation are dropped, which breaks their promise
                if ((*item)->generation != generation) {
                    continue;
                }

                taskStopToken = stopSource.get_token();
                bProcessing = true;
            }

            execute(**item, taskStopToken);
            bProcessing = false;
        }

        if (hadData) {
            std::function<void()> handler;
            {
                std::unique_lock<std::mutex> lock(handlerMutex);
                handler = idleHandler;
            }

            if (handler) {
                handler();
            }
        }
    }

    void execute(sQueueItem& item, const std::stop_token& stopToken) {
        try {
            auto result = item.task(stopToken);

            std::function<void(const T&)> handler;
            {
                std::unique_lock<std::mutex> lock(handlerMutex);
                handler = successHandler;
            }

            if (handler) {
                handler(result);
            }

            item.promise.set_value(std::move(result));
        } catch (...) {
            // The exception is forwarded to the error handler and always stored in the task's future
            auto exception = std::current_exception();

            std::function<void(std::exception_ptr)> handler;
            {
                std::unique_lock<std::mutex> lock(handlerMutex);
                handler = errorHandler;
            }

            if (handler) {
                handler(exception);
            }

            item.promise.set_exception(exception);
        }
    }

    folly::UMPSCQueue<std::shared_ptr<sQueueItem>, false> queue;

    mutable std::mutex dataCVMutex;
    std::condition_variable_any dataCV;
    bool dataReady = false;
    uint64_t generation = 0;
    std::stop_source stopSource;
    std::atomic<bool> bProcessing = false;

    std::mutex handlerMutex;
    std::function<void(const T&)> successHandler;
    std::function<void(std::exception_ptr)> errorHandler;
    std::function<void()> idleHandler;

    // Declared last so everything above is constructed before the consumer starts, and outlives it on destruction
    std::jthread consumerThread = std::jthread([this](const std::stop_token& stopToken) { run(stopToken); });

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(generation);
};

#endif //BULK_SUBMIT_SERVER_TASKQUEUE_H
