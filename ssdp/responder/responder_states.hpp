#pragma once

namespace ssdp
{
enum class ResponderState
{
    stopped,
    starting,
    running,
    shutting_down,
};

inline const char* to_string(ResponderState state) noexcept
{
    switch (state)
    {
    case ResponderState::stopped:
        return "stopped";

    case ResponderState::starting:
        return "starting";

    case ResponderState::running:
        return "running";

    case ResponderState::shutting_down:
        return "shutting_down";
    }

    return "unknown";
}

} // namespace ssdp
