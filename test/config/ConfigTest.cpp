#include "config/Config.h"
#include "config/ConfigReader.h"
#include "roster/RosterSettings.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

namespace
{
class SampleConfig : public config::ConfigReader
{
public:
    CFG_PROP(std::string, name, "roster");
    CFG_MANDATORY_PROP(std::string, region);
    CFG_PROP(int32_t, pageSize, 50);
    CFG_MANDATORY_PROP(uint64_t, peerId);
    CFG_GROUP()
    CFG_PROP(uint32_t, intervalMs, 1000);
    CFG_PROP(std::string, label, "decay");
    CFG_GROUP_END(decay);
    CFG_GROUP()
    CFG_PROP(uint32_t, count, 10);
    CFG_GROUP()
    CFG_PROP(bool, enabled, false);
    CFG_GROUP_END(gaps);
    CFG_GROUP_END(sim);
};

void writeSampleConfig(std::ostream& s)
{
    s << "{" << std::endl;
    s << "  \"region\": \"eu\"," << std::endl;
    s << "  \"peerId\": 4711," << std::endl;
    s << "  \"decay.label\": \"sweep\"," << std::endl;
    s << "  \"sim.count\": 300," << std::endl;
    s << "  \"sim.gaps.enabled\": true" << std::endl;
    s << "}" << std::endl;
}

void verifySampleConfig(const SampleConfig& cfg)
{
    EXPECT_EQ("roster", cfg.name.get());
    EXPECT_EQ("eu", cfg.region.get());
    EXPECT_EQ(50, cfg.pageSize);
    EXPECT_EQ(4711u, cfg.peerId);
    EXPECT_EQ(1000u, cfg.decay.intervalMs);
    EXPECT_EQ("sweep", cfg.decay.label.get());
    EXPECT_EQ(300u, cfg.sim.count);
    EXPECT_TRUE(cfg.sim.gaps.enabled);
}
} // namespace

TEST(ConfigTest, readsFromFile)
{
    char fileName[11] = "cfg-XXXXXX";
    const auto handle = mkstemp(fileName);
    ASSERT_GT(handle, 0);

    std::ofstream file(fileName);
    writeSampleConfig(file);
    file.close();

    SampleConfig cfg;
    EXPECT_TRUE(cfg.readFromFile(fileName));
    verifySampleConfig(cfg);

    close(handle);
    remove(fileName);
}

TEST(ConfigTest, readsFromString)
{
    std::ostringstream ss;
    writeSampleConfig(ss);

    SampleConfig cfg;
    ASSERT_TRUE(cfg.readFromString(ss.str()));
    verifySampleConfig(cfg);
}

TEST(ConfigTest, brokenJsonKeepsDefaults)
{
    SampleConfig cfg;
    EXPECT_FALSE(cfg.readFromString("{ region }"));
    EXPECT_EQ("roster", cfg.name.get());
    EXPECT_EQ(1000u, cfg.decay.intervalMs);
}

TEST(ConfigTest, missingMandatoryKeyFails)
{
    SampleConfig cfg;
    EXPECT_FALSE(cfg.readFromString("{ \"region\": \"us\" }"));
    EXPECT_EQ("us", cfg.region.get());
    EXPECT_EQ(0u, cfg.peerId);
}

TEST(ConfigTest, missingFileFails)
{
    SampleConfig cfg;
    EXPECT_FALSE(cfg.readFromFile("/nonexistent/rostersim.json"));
}

TEST(ConfigTest, rosterDefaults)
{
    config::Config cfg;
    ASSERT_TRUE(cfg.readFromString("{}"));

    const auto settings = roster::RosterSettings::fromConfig(cfg);
    EXPECT_EQ(100, settings.fetchLimit);
    EXPECT_EQ(10000u, settings.decayIntervalMs);
    EXPECT_EQ(60000u, settings.rankTimeoutMs);
    EXPECT_EQ(50u, cfg.simulator.gapEveryNthUpdate);
}

TEST(ConfigTest, rosterSettingsFromGroups)
{
    config::Config cfg;
    ASSERT_TRUE(cfg.readFromString(
        "{ \"participants.fetchLimit\": 25, \"activity.rankTimeoutMs\": 5000, \"call.myPeerId\": 9 }"));

    const auto settings = roster::RosterSettings::fromConfig(cfg);
    EXPECT_EQ(25, settings.fetchLimit);
    EXPECT_EQ(10000u, settings.decayIntervalMs);
    EXPECT_EQ(5000u, settings.rankTimeoutMs);
    EXPECT_EQ(9u, cfg.call.myPeerId);
}

TEST(ConfigTest, rejectsNonPositiveFetchLimit)
{
    config::Config cfg;
    EXPECT_FALSE(cfg.readFromString("{ \"participants.fetchLimit\": 0 }"));
}

TEST(ConfigTest, rejectsWrongType)
{
    config::Config cfg;
    EXPECT_FALSE(cfg.readFromString("{ \"activity.rankTimeoutMs\": \"soon\" }"));
    EXPECT_EQ(60000u, cfg.activity.rankTimeoutMs);
}

TEST(ConfigTest, dumpHasEffectiveValues)
{
    SampleConfig cfg;
    ASSERT_TRUE(cfg.readFromString("{ \"region\": \"ap\", \"peerId\": 3 }"));

    const auto document = nlohmann::json::parse(cfg.dump());
    EXPECT_EQ("ap", document["region"].get<std::string>());
    EXPECT_EQ(50, document["pageSize"].get<int32_t>());
    EXPECT_EQ(1000u, document["decay.intervalMs"].get<uint32_t>());
    EXPECT_FALSE(document["sim.gaps.enabled"].get<bool>());
}
