#pragma once
#include "procsup/process.hpp"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace procsup
{

/// A line of child output, or std::nullopt as the end-of-stream marker
using LineEvent = std::optional<std::string>;
using LineCallback = std::function<void(const LineEvent&)>;

/**
 * Reads one child output stream line by line on a detached thread.
 *
 * The callback sees every line in the order the child wrote it, then
 * exactly one end-of-stream marker. finished() becomes ready after the
 * marker was delivered.
 *
 * If the callback throws, the pump stops calling it for further lines but
 * keeps draining the pipe, still delivers the marker, and reports the
 * exception through finished(). A pump never touches another pump's state.
 */
class StreamPump
{
  public:
    /// Takes ownership of the pipe and starts the reader thread
    StreamPump(std::unique_ptr<process::ReadPipe> pipe, LineCallback callback);

    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;
    StreamPump(StreamPump&&) noexcept = default;
    StreamPump& operator=(StreamPump&&) noexcept = default;

    const std::shared_future<void>& finished() const
    {
        return finished_;
    }

  private:
    std::shared_future<void> finished_;
};

} // namespace procsup
