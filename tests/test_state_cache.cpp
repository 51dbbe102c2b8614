#include "anthem/core/StateCache.hpp"
#include "TestAssert.hpp"

#include <string>

using namespace anthem;
using namespace anthem::protocol;

static void testStartsUnknown() {
    StateCache cache;
    ASSERT_TRUE(cache.empty(), "fresh cache empty");
    ASSERT_TRUE(!cache.zone(1).has_value(), "no zone record");
    ASSERT_TRUE(!cache.model().has_value(), "no model");
    ASSERT_TRUE(!cache.value("power", 1).has_value(), "no power value");
    ASSERT_TRUE(cache.inputNames().empty(), "no input names");
}

static void testUnknownLineChangesNothing() {
    StateCache cache;
    cache.apply(parseResponse("Z1POW1"));
    ASSERT_TRUE(!cache.apply(parseResponse("XYZZY")), "unrecognized not applied");
    const auto zone = cache.zone(1);
    ASSERT_TRUE(zone && zone->power && *zone->power, "power kept");
    ASSERT_TRUE(zone && !zone->volume && !zone->muted && !zone->input, "nothing else appeared");
    ASSERT_TRUE(!cache.model().has_value(), "globals untouched");
    ASSERT_TRUE(!cache.zone(2).has_value(), "no other zone");
}

static void testZoneFieldsAreIndependent() {
    StateCache cache;
    ASSERT_TRUE(cache.apply(parseResponse("Z2VOL-30")), "volume applied");
    auto zone = cache.zone(2);
    ASSERT_TRUE(zone && zone->volume && *zone->volume == -30, "volume stored");
    ASSERT_TRUE(zone && !zone->power, "power still unknown");

    cache.apply(parseResponse("Z2MUT1"));
    cache.apply(parseResponse("Z2INP4"));
    cache.apply(parseResponse("Z2SIP\"Game\""));
    cache.apply(parseResponse("Z2AIC\"PCM 2.0\""));
    cache.apply(parseResponse("Z2POW0"));
    zone = cache.zone(2);
    ASSERT_TRUE(zone && zone->muted && *zone->muted, "muted");
    ASSERT_TRUE(zone && zone->input && *zone->input == 4, "input");
    ASSERT_TRUE(zone && zone->inputName && *zone->inputName == "Game", "input name");
    ASSERT_TRUE(zone && zone->audioFormat && *zone->audioFormat == "PCM 2.0", "audio format");
    ASSERT_TRUE(zone && zone->power && !*zone->power, "power off");
    ASSERT_TRUE(zone && zone->volume && *zone->volume == -30, "volume unchanged by later reports");
}

static void testKeyLookup() {
    StateCache cache;
    cache.apply(parseResponse("IDMMRX 1140"));
    cache.apply(parseResponse("IDS2.0"));
    cache.apply(parseResponse("Z1VOL-12"));
    cache.apply(parseResponse("Z1MUT0"));

    auto model = cache.value("model");
    ASSERT_TRUE(model && std::get<std::string>(*model) == "MRX 1140", "model by key");
    auto sw = cache.value("software_version");
    ASSERT_TRUE(sw && std::get<std::string>(*sw) == "2.0", "software version by key");
    ASSERT_TRUE(!cache.value("region").has_value(), "region never reported");

    auto vol = cache.value("volume", 1);
    ASSERT_TRUE(vol && std::get<int>(*vol) == -12, "volume by key");
    auto muted = cache.value("muted", 1);
    ASSERT_TRUE(muted && std::get<bool>(*muted) == false, "muted by key");
    ASSERT_TRUE(!cache.value("power", 1).has_value(), "power never reported");
    ASSERT_TRUE(!cache.value("volume", 3).has_value(), "other zone unknown");
    ASSERT_TRUE(!cache.value("bogus", 1).has_value(), "unknown key");
}

static void testInputNames() {
    StateCache cache;
    cache.apply(parseResponse("ISN1\"HDMI 1\""));
    cache.apply(parseResponse("ISN2\"\""));
    cache.apply(parseResponse("ISN1\"Blu-ray\""));

    const auto names = cache.inputNames();
    ASSERT_EQ(names.size(), std::size_t{2}, "two slots");
    ASSERT_EQ(cache.inputName(1).value_or(""), std::string("Blu-ray"), "later report wins");
    ASSERT_EQ(cache.inputName(2).value_or(""), std::string("Input 2"), "fallback stored");
    ASSERT_TRUE(!cache.inputName(3).has_value(), "unknown slot");

    ASSERT_EQ(cache.inputNumberByName("Blu-ray").value_or(-1), 1, "inverse lookup");
    ASSERT_TRUE(!cache.inputNumberByName("HDMI 1").has_value(), "stale name gone");
}

int main() {
    testStartsUnknown();
    testUnknownLineChangesNothing();
    testZoneFieldsAreIndependent();
    testKeyLookup();
    testInputNames();
    return finishTests("StateCache");
}
