#include "symbolworker.hpp"

#include <iostream>

namespace oceanbook {

SymbolWorker::SymbolWorker(std::string symbol) : m_symbol(std::move(symbol)), m_book(m_symbol)
{
    m_thread = std::thread([this]() { run(); });
}

SymbolWorker::~SymbolWorker() { stop(); }

void SymbolWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_wakeup.notify_one();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void SymbolWorker::run()
{
    while (true) {
        std::function<void()> command;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wakeup.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });

            // Drain everything queued before the stop request
            if (m_queue.empty()) {
                return;
            }
            command = std::move(m_queue.front());
            m_queue.pop_front();
        }

        // packaged_task stores any exception in the caller's future
        command();
    }
}

void SymbolWorker::reportHalt(const std::exception& error) const
{
    std::cerr << "[oceanbook] book " << m_symbol << " halted: " << error.what() << std::endl;
}

} // namespace oceanbook
