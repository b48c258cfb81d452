#include "io/settings_file.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace drift
{
namespace
{
static void EnsureParentDirExists(const std::string& path, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = e.what();
    }
}
} // namespace

JsonFileStore::JsonFileStore(std::string path)
    : m_path(std::move(path))
{
}

bool JsonFileStore::Load(std::string& err)
{
    err.clear();
    m_root = json::object();

    std::ifstream f(m_path, std::ios::binary);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(m_path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open settings file for reading: ") + m_path;
            return false;
        }
        return true; // first run
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse settings file (") + m_path + "): " + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = std::string("Settings file root is not an object: ") + m_path;
        return false;
    }

    m_root = std::move(j);
    return true;
}

bool JsonFileStore::Save(std::string& err) const
{
    err.clear();

    std::string derr;
    EnsureParentDirExists(m_path, derr);
    if (!derr.empty())
    {
        err = std::string("Failed to create config directory: ") + derr;
        return false;
    }

    const std::string tmp_path = m_path + ".tmp";
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "Failed to open temp settings file for writing.";
        return false;
    }

    try
    {
        out << m_root.dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write settings: ") + e.what();
        return false;
    }

    out.close();
    if (!out)
    {
        err = "Failed to finalize settings temp file write.";
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, m_path, ec);
    if (ec)
    {
        err = std::string("Failed to atomically replace settings file: ") + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}

std::optional<long long> JsonFileStore::GetInt(const std::string& key) const
{
    auto it = m_root.find(key);
    if (it == m_root.end())
        return std::nullopt;
    // Out-of-range numbers saturate so callers clamp them like any other value.
    constexpr long long kMax = std::numeric_limits<long long>::max();
    constexpr long long kMin = std::numeric_limits<long long>::min();
    if (it->is_number_unsigned())
    {
        const unsigned long long v = it->get<unsigned long long>();
        return v > (unsigned long long)kMax ? kMax : (long long)v;
    }
    if (it->is_number_integer())
        return it->get<long long>();
    if (it->is_number_float())
    {
        const double v = it->get<double>();
        if (std::isnan(v))
            return std::nullopt;
        // 2^63 is exact as a double; anything at or above it overflows.
        if (v >= 9223372036854775808.0)
            return kMax;
        if (v <= -9223372036854775808.0)
            return kMin;
        return (long long)v;
    }
    return std::nullopt;
}

bool JsonFileStore::SetInt(const std::string& key, long long value, std::string& err)
{
    m_root[key] = value;
    return Save(err);
}

std::vector<ProviderTemplateEntry> JsonFileStore::ProviderTemplates() const
{
    std::vector<ProviderTemplateEntry> out;
    auto it = m_root.find("providers");
    if (it == m_root.end() || !it->is_array())
        return out;

    for (const json& e : *it)
    {
        if (!e.is_object())
            continue;
        if (!e.contains("template") || !e["template"].is_string())
            continue;
        ProviderTemplateEntry entry;
        entry.url_template = e["template"].get<std::string>();
        if (entry.url_template.empty())
            continue;
        if (e.contains("name") && e["name"].is_string())
            entry.name = e["name"].get<std::string>();
        else
            entry.name = "provider" + std::to_string(out.size() + 1);
        out.push_back(std::move(entry));
    }
    return out;
}
} // namespace drift
