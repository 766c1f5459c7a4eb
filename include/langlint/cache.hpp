#pragma once

#include <langlint/types.hpp>

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace langlint {

/**
 * Thread-safe memo of ParseResults keyed by "{path}:{hash(path, content)}".
 *
 * Unbounded; entries live until remove() or clear(). A changed file needs
 * a freshly generated key.
 */
class Cache {
public:
    Cache() = default;

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    std::optional<ParseResult> get(const std::string& key) const;
    void set(const std::string& key, ParseResult value);
    bool contains(const std::string& key) const;
    std::optional<ParseResult> remove(const std::string& key);
    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }

    static std::string generate_key(const std::string& path, const std::string& content);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ParseResult> entries_;
};

}  // namespace langlint
