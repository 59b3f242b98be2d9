#pragma once

#include <atomic>

namespace enumerant::generator
{
    /// Cooperative cancellation flag shared between the host and a running pass.
    class CancellationToken
    {
    public:
        void requestCancellation() noexcept
        {
            m_requested.store(true, std::memory_order_release);
        }

        [[nodiscard]] bool isCancellationRequested() const noexcept
        {
            return m_requested.load(std::memory_order_acquire);
        }

        void reset() noexcept
        {
            m_requested.store(false, std::memory_order_release);
        }

    private:
        std::atomic<bool> m_requested{false};
    };
} // namespace enumerant::generator
