#include <langlint/cache.hpp>
#include <langlint/util/hash.hpp>

#include <mutex>

namespace langlint {

std::optional<ParseResult> Cache::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Cache::set(const std::string& key, ParseResult value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(value);
}

bool Cache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

std::optional<ParseResult> Cache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    ParseResult removed = std::move(it->second);
    entries_.erase(it);
    return removed;
}

void Cache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t Cache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::string Cache::generate_key(const std::string& path, const std::string& content) {
    // The separator keeps ("ab", "c") and ("a", "bc") apart
    uint64_t hash = Fnv1a::compute(path);
    const uint8_t separator = 0;
    hash = Fnv1a::update(hash, &separator, 1);
    hash = Fnv1a::update(hash, content);
    return path + ":" + Fnv1a::to_hex(hash);
}

}  // namespace langlint
