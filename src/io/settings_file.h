#pragma once

#include "core/key_value_store.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace drift
{
struct ProviderTemplateEntry
{
    std::string name;
    std::string url_template;
};

// Flat JSON object on disk ("<config_dir>/settings.json").
//
// {
//   "bg-interval": 60,
//   "bg-blur": 0,
//   "providers": [ { "name": "picsum", "template": "https://picsum.photos/{w}/{h}?random={nonce}" } ]
// }
//
// Every SetInt() rewrites the whole file atomically (temp file + rename).
class JsonFileStore : public KeyValueStore
{
public:
    using json = nlohmann::json;

    explicit JsonFileStore(std::string path);

    const std::string& Path() const { return m_path; }

    // A missing file is not an error. A file that fails to parse, or whose root
    // is not an object, is reported through `err` and the store starts empty.
    bool Load(std::string& err);

    bool Save(std::string& err) const;

    std::optional<long long> GetInt(const std::string& key) const override;
    bool SetInt(const std::string& key, long long value, std::string& err) override;

    // Entries of the "providers" array that have a non-empty template.
    // Malformed entries are skipped; a missing or non-array value yields {}.
    std::vector<ProviderTemplateEntry> ProviderTemplates() const;

    const json& Root() const { return m_root; }

private:
    std::string m_path;
    json m_root = json::object();
};
} // namespace drift
