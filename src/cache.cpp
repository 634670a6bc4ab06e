#include "procsup/cache.hpp"

#include "procsup/exceptions.hpp"

#include <fstream>
#include <iostream>

namespace procsup
{

namespace
{

std::int64_t now_seconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               Cache::SystemClock::now().time_since_epoch())
        .count();
}

} // namespace

Cache Cache::load(const std::filesystem::path& path)
{
    Cache cache(path);
    std::ifstream in(path);
    if (!in.is_open())
        return cache;

    auto data = Json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
    {
        std::cerr << "procsup: ignoring unreadable cache " << path.string() << std::endl;
        return cache;
    }

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const auto& entry = it.value();
        if (entry.is_object() && entry.contains("value") && entry.contains("timestamp") &&
            entry["timestamp"].is_number())
            cache.entries_[it.key()] = entry;
    }
    return cache;
}

Cache::Cache(Cache&& other) noexcept
    : path_(std::move(other.path_)), entries_(std::move(other.entries_))
{
}

Cache& Cache::operator=(Cache&& other) noexcept
{
    if (this != &other)
    {
        path_ = std::move(other.path_);
        entries_ = std::move(other.entries_);
    }
    return *this;
}

void Cache::invalidate(std::chrono::seconds ttl)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = now_seconds() - ttl.count();
    bool changed = false;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (it.value()["timestamp"].get<std::int64_t>() < cutoff)
        {
            it = entries_.erase(it);
            changed = true;
        }
        else
        {
            ++it;
        }
    }
    if (changed)
        save_locked();
}

bool Cache::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(key);
}

std::optional<Json> Cache::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return (*it)["value"];
}

void Cache::set(const std::string& key, const Json& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Json{{"value", value}, {"timestamp", now_seconds()}};
    save_locked();
}

Json Cache::lookup(const std::string& key, const std::function<Json()>& compute)
{
    if (auto cached = get(key))
        return *cached;
    Json value = compute();
    set(key, value);
    return value;
}

void Cache::save() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    save_locked();
}

size_t Cache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void Cache::save_locked() const
{
    namespace fs = std::filesystem;
    if (path_.has_parent_path())
        fs::create_directories(path_.parent_path());

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
            throw Error("Cannot write cache file: " + tmp.string());
        out << entries_.dump(2);
        if (!out)
            throw Error("Failed writing cache file: " + tmp.string());
    }
    fs::rename(tmp, path_);
}

} // namespace procsup
