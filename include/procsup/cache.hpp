#pragma once
#include "procsup/types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace procsup
{

/**
 * Small JSON file cache with time-based invalidation.
 *
 * The file holds {"<key>": {"value": <json>, "timestamp": <unix seconds>}}.
 * Every change is saved immediately (temp file + rename).
 */
class Cache
{
  public:
    using SystemClock = std::chrono::system_clock;

    /// Load the cache stored at path; a missing or unreadable file yields an
    /// empty cache bound to that path
    static Cache load(const std::filesystem::path& path);

    explicit Cache(std::filesystem::path path) : path_(std::move(path)) {}

    Cache(Cache&& other) noexcept;
    Cache& operator=(Cache&& other) noexcept;

    /// Drop entries stored more than ttl ago
    void invalidate(std::chrono::seconds ttl);

    bool contains(const std::string& key) const;
    std::optional<Json> get(const std::string& key) const;
    void set(const std::string& key, const Json& value);

    /// Cached value for key, or compute(), store and return it
    Json lookup(const std::string& key, const std::function<Json()>& compute);

    void save() const;

    const std::filesystem::path& path() const
    {
        return path_;
    }
    size_t size() const;

  private:
    void save_locked() const;

    std::filesystem::path path_;
    Json entries_ = Json::object();
    mutable std::mutex mutex_;
};

} // namespace procsup
