#pragma once

#include <optional>
#include <string>

namespace drift
{
// Persisted key-value store for integer settings.
// JsonFileStore is the on-disk implementation; tests use an in-memory one.
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<long long> GetInt(const std::string& key) const = 0;

    // Stores and persists. Returns false (with `err`) if persisting failed; the
    // value is still visible to GetInt() in that case.
    virtual bool SetInt(const std::string& key, long long value, std::string& err) = 0;
};
} // namespace drift
