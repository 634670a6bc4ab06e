#pragma once
#include "procsup/types.hpp"

#include <atomic>

namespace procsup
{

/// Issues invocation tracks 1, 2, 3, ... Safe to call from any thread.
class TrackSequencer
{
  public:
    Track next()
    {
        return counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    /// Last track handed out (0 before the first call)
    Track last() const
    {
        return counter_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<Track> counter_{0};
};

} // namespace procsup
