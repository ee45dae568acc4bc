#pragma once

#include <atomic>

namespace ssdp
{

/**
 * @brief Process-wide "responder is running" flag shared by the receiver, scheduler and dispatcher.
 *
 * Single writer: only shutdown clears it. Every unit polls it between bounded waits.
 */
class RunState
{
public:
    RunState() = default;

    RunState(const RunState&)            = delete;
    RunState& operator=(const RunState&) = delete;

    void set_running() noexcept { _running.store(true, std::memory_order_release); }

    void set_stopped() noexcept { _running.store(false, std::memory_order_release); }

    bool is_running() const noexcept { return _running.load(std::memory_order_acquire); }

private:
    std::atomic_bool _running {false};
};

} // namespace ssdp
