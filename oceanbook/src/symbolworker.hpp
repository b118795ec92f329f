#pragma once

#include "orderbook.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace oceanbook {

// Exclusive owner of one symbol's OrderBook.
// Commands run one at a time on a dedicated thread in the order they were posted, so
// matching for a symbol is strictly sequential while symbols run in parallel.
class SymbolWorker {
public:
    explicit SymbolWorker(std::string symbol);
    ~SymbolWorker();

    SymbolWorker(const SymbolWorker&) = delete;
    SymbolWorker& operator=(const SymbolWorker&) = delete;

    // Queue a command against the book. Its result, or the exception it threw, is
    // delivered through the returned future.
    template <typename Command>
    auto post(Command command) -> std::future<std::invoke_result_t<Command&, OrderBook&>>
    {
        using Result = std::invoke_result_t<Command&, OrderBook&>;

        auto task = std::make_shared<std::packaged_task<Result()>>(
            [this, command = std::move(command)]() mutable -> Result {
                try {
                    return command(m_book);
                } catch (const BookHalted&) {
                    throw;
                } catch (const std::exception& e) {
                    if (m_book.halted()) {
                        reportHalt(e);
                    }
                    throw;
                }
            });
        auto result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("Worker for " + m_symbol + " is stopped");
            }
            m_queue.emplace_back([task]() { (*task)(); });
        }
        m_wakeup.notify_one();

        return result;
    }

    // Finish queued commands and join the thread
    void stop();

    [[nodiscard]] const std::string& symbol() const { return m_symbol; }

private:
    void run();
    void reportHalt(const std::exception& error) const;

    std::string m_symbol;
    OrderBook m_book;

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::deque<std::function<void()>> m_queue;
    bool m_stopping = false;

    std::thread m_thread;
};

} // namespace oceanbook
