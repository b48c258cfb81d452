#include <gtest/gtest.h>

#include "io/settings_file.h"
#include "rotation/config_store.h"
#include "rotation/rotation_state.h"

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace drift;

namespace fs = std::filesystem;

namespace
{
// Fresh directory per test under the system temp dir.
struct TempDir
{
    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / ("drift_test_" + name))
    {
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path, ec);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string File(const std::string& name) const { return (path / name).string(); }

    fs::path path;
};

void WriteText(const std::string& path, const std::string& text)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
}
} // namespace

TEST(JsonFileStore, MissingFileIsNotAnError)
{
    TempDir dir("missing");
    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    EXPECT_TRUE(store.Load(err));
    EXPECT_TRUE(err.empty());
    EXPECT_FALSE(store.GetInt("bg-interval").has_value());
}

TEST(JsonFileStore, ReadsIntegersAndFloats)
{
    TempDir dir("read");
    WriteText(dir.File("settings.json"), R"({"bg-interval": 300, "bg-blur": 4.0, "name": "x"})");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    ASSERT_TRUE(store.Load(err)) << err;
    EXPECT_EQ(store.GetInt("bg-interval").value_or(-1), 300);
    EXPECT_EQ(store.GetInt("bg-blur").value_or(-1), 4);
    EXPECT_FALSE(store.GetInt("name").has_value());
}

TEST(JsonFileStore, OutOfRangeNumbersSaturate)
{
    TempDir dir("range");
    WriteText(dir.File("settings.json"),
              R"({"huge-float": 1e20, "tiny-float": -1e20, "huge-unsigned": 18446744073709551615, "edge": 9223372036854775807})");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    ASSERT_TRUE(store.Load(err)) << err;

    const long long max = std::numeric_limits<long long>::max();
    const long long min = std::numeric_limits<long long>::min();
    EXPECT_EQ(store.GetInt("huge-float").value_or(0), max);
    EXPECT_EQ(store.GetInt("tiny-float").value_or(0), min);
    EXPECT_EQ(store.GetInt("huge-unsigned").value_or(0), max);
    EXPECT_EQ(store.GetInt("edge").value_or(0), max);
}

TEST(JsonFileStore, HugePersistedIntervalClampsToDeviceMaximum)
{
    for (const char* text : {R"({"bg-interval": 1e20, "bg-blur": 1e20})",
                             R"({"bg-interval": 18446744073709551615, "bg-blur": 18446744073709551615})"})
    {
        TempDir dir("huge_interval");
        WriteText(dir.File("settings.json"), text);

        JsonFileStore store(dir.File("settings.json"));
        std::string err;
        ASSERT_TRUE(store.Load(err)) << err;

        RotationState state;
        ConfigStore config(store, state, DeviceHint::ForClass(DeviceClass::Large, false));
        config.Load();
        EXPECT_EQ(config.GetInterval(), 3600u) << text;
        EXPECT_EQ(config.GetBlur(), 24u) << text;
    }
}

TEST(JsonFileStore, SetIntPersistsAcrossInstances)
{
    TempDir dir("persist");
    const std::string path = dir.File("nested/settings.json");
    {
        JsonFileStore store(path);
        std::string err;
        ASSERT_TRUE(store.SetInt("bg-interval", 15, err)) << err;
        ASSERT_TRUE(store.SetInt("bg-blur", 8, err)) << err;
    }
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    JsonFileStore reloaded(path);
    std::string err;
    ASSERT_TRUE(reloaded.Load(err)) << err;
    EXPECT_EQ(reloaded.GetInt("bg-interval").value_or(-1), 15);
    EXPECT_EQ(reloaded.GetInt("bg-blur").value_or(-1), 8);
}

TEST(JsonFileStore, SetIntKeepsUnrelatedKeys)
{
    TempDir dir("keep");
    WriteText(dir.File("settings.json"), R"({"providers": [{"name": "a", "template": "https://a.test/{w}"}]})");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    ASSERT_TRUE(store.Load(err));
    ASSERT_TRUE(store.SetInt("bg-blur", 2, err));

    JsonFileStore reloaded(dir.File("settings.json"));
    ASSERT_TRUE(reloaded.Load(err));
    EXPECT_EQ(reloaded.ProviderTemplates().size(), 1u);
}

TEST(JsonFileStore, CorruptFileReportsErrorAndStartsEmpty)
{
    TempDir dir("corrupt");
    WriteText(dir.File("settings.json"), "{ this is not json");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    EXPECT_FALSE(store.Load(err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(store.Root().is_object());
    EXPECT_TRUE(store.Root().empty());

    // Still usable afterwards.
    EXPECT_TRUE(store.SetInt("bg-interval", 30, err)) << err;
    EXPECT_EQ(store.GetInt("bg-interval").value_or(-1), 30);
}

TEST(JsonFileStore, NonObjectRootIsRejected)
{
    TempDir dir("array");
    WriteText(dir.File("settings.json"), "[1, 2, 3]");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    EXPECT_FALSE(store.Load(err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(store.Root().is_object());
}

TEST(JsonFileStore, ProviderTemplatesSkipMalformedEntries)
{
    TempDir dir("providers");
    WriteText(dir.File("settings.json"), R"({
        "providers": [
            { "name": "first", "template": "https://first.test/{w}/{h}?r={nonce}" },
            { "template": "https://unnamed.test/{w}" },
            { "name": "empty", "template": "" },
            { "name": "wrong-type", "template": 42 },
            "not-an-object"
        ]
    })");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    ASSERT_TRUE(store.Load(err)) << err;

    const std::vector<ProviderTemplateEntry> entries = store.ProviderTemplates();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "first");
    EXPECT_EQ(entries[0].url_template, "https://first.test/{w}/{h}?r={nonce}");
    EXPECT_EQ(entries[1].name, "provider2");
}

TEST(JsonFileStore, ProvidersOfWrongTypeYieldNothing)
{
    TempDir dir("providers_bad");
    WriteText(dir.File("settings.json"), R"({"providers": {"name": "x"}})");

    JsonFileStore store(dir.File("settings.json"));
    std::string err;
    ASSERT_TRUE(store.Load(err));
    EXPECT_TRUE(store.ProviderTemplates().empty());
}
