#include "anthem/protocol/AnthemResponse.hpp"
#include "TestAssert.hpp"

#include <string>

using namespace anthem::protocol;

template <typename T>
static const T* as(const ResponseEvent& event) {
    return std::get_if<T>(&event);
}

static void testIdentity() {
    auto model = parseResponse("IDM MRX 720 ");
    ASSERT_TRUE(as<ModelReported>(model), "IDM is model");
    if (auto* m = as<ModelReported>(model)) ASSERT_EQ(m->model, std::string("MRX 720"), "model trimmed");

    auto name = parseResponse("IDNLiving Room");
    ASSERT_TRUE(as<DeviceNameReported>(name), "IDN is name");
    if (auto* n = as<DeviceNameReported>(name)) ASSERT_EQ(n->name, std::string("Living Room"), "name");

    auto region = parseResponse("IDRUS");
    ASSERT_TRUE(as<RegionReported>(region), "IDR is region");

    auto sw = parseResponse("IDS1.2.3");
    ASSERT_TRUE(as<SoftwareVersionReported>(sw), "IDS is software version");
    if (auto* s = as<SoftwareVersionReported>(sw)) ASSERT_EQ(s->version, std::string("1.2.3"), "version");
}

static void testPowerForEveryZone() {
    for (int zone = 1; zone <= 4; ++zone) {
        for (int flag = 0; flag <= 1; ++flag) {
            const auto line = "Z" + std::to_string(zone) + "POW" + std::to_string(flag);
            auto event = parseResponse(line);
            auto* power = as<PowerChanged>(event);
            ASSERT_TRUE(power, "power parsed");
            if (power) {
                ASSERT_EQ(power->zone, zone, "power zone");
                ASSERT_EQ(power->on, flag == 1, "power flag follows the digit");
            }
        }
    }
}

static void testZoneFields() {
    auto vol = parseResponse("Z2VOL-45");
    ASSERT_TRUE(as<VolumeChanged>(vol), "volume parsed");
    if (auto* v = as<VolumeChanged>(vol)) {
        ASSERT_EQ(v->zone, 2, "volume zone");
        ASSERT_EQ(v->db, -45, "negative volume");
    }

    auto volZero = parseResponse("Z1VOL0");
    if (auto* v = as<VolumeChanged>(volZero)) ASSERT_EQ(v->db, 0, "zero volume");
    else ASSERT_TRUE(false, "Z1VOL0 parsed");

    auto mute = parseResponse("Z1MUT1");
    ASSERT_TRUE(as<MuteChanged>(mute) && as<MuteChanged>(mute)->muted, "mute on");

    auto input = parseResponse("Z1INP12");
    ASSERT_TRUE(as<InputChanged>(input), "input parsed");
    if (auto* i = as<InputChanged>(input)) ASSERT_EQ(i->input, 12, "input index");

    auto sip = parseResponse("Z1SIP\"Apple TV\"");
    ASSERT_TRUE(as<InputNameChanged>(sip), "zone input name");
    if (auto* s = as<InputNameChanged>(sip)) ASSERT_EQ(s->name, std::string("Apple TV"), "zone input name text");

    auto aic = parseResponse("Z1AIC\"Dolby Atmos\"");
    ASSERT_TRUE(as<AudioFormatChanged>(aic), "audio format");
    if (auto* a = as<AudioFormatChanged>(aic)) ASSERT_EQ(a->format, std::string("Dolby Atmos"), "format text");
}

static void testQuotedTextIsNotAVerb() {
    auto sip = parseResponse("Z1SIP\"POWER AMP 1\"");
    ASSERT_TRUE(as<InputNameChanged>(sip), "SIP wins over POW inside quotes");
    if (auto* s = as<InputNameChanged>(sip)) ASSERT_EQ(s->name, std::string("POWER AMP 1"), "quoted text intact");
}

static void testInputSlotNames() {
    auto named = parseResponse("ISN3\"  Blu-ray  Player \"");
    auto* slot = as<InputNameDiscovered>(named);
    ASSERT_TRUE(slot, "ISN parsed");
    if (slot) {
        ASSERT_EQ(slot->input, 3, "slot index");
        ASSERT_EQ(slot->name, std::string("Blu-ray  Player"), "surrounding whitespace trimmed, inner kept");
    }

    auto empty = parseResponse("ISN11\"\"");
    auto* fallback = as<InputNameDiscovered>(empty);
    ASSERT_TRUE(fallback, "empty ISN parsed");
    if (fallback) ASSERT_EQ(fallback->name, std::string("Input 11"), "empty name falls back");

    auto blank = parseResponse("ISN4\"   \"");
    if (auto* b = as<InputNameDiscovered>(blank)) ASSERT_EQ(b->name, std::string("Input 4"), "blank name falls back");
    else ASSERT_TRUE(false, "blank ISN parsed");
}

static void testUnrecognized() {
    ASSERT_TRUE(!isRecognized(parseResponse("XYZZY")), "XYZZY unrecognized");
    ASSERT_TRUE(!isRecognized(parseResponse("Z")), "bare Z");
    ASSERT_TRUE(!isRecognized(parseResponse("ZPOW1")), "zone number missing");
    ASSERT_TRUE(!isRecognized(parseResponse("Z1POW")), "power flag missing");
    ASSERT_TRUE(!isRecognized(parseResponse("Z1POW7")), "power flag invalid");
    ASSERT_TRUE(!isRecognized(parseResponse("Z1VOL-")), "volume digits missing");
    ASSERT_TRUE(!isRecognized(parseResponse("Z1SIP\"unterminated")), "unterminated quote");
    ASSERT_TRUE(!isRecognized(parseResponse("ISN\"Name\"")), "slot index missing");
    ASSERT_TRUE(!isRecognized(parseResponse("ISN2Name")), "slot name not quoted");
    ASSERT_TRUE(!isRecognized(parseResponse("Z1VUP")), "unknown zone verb");
    ASSERT_EQ(std::string(eventName(parseResponse("XYZZY"))), std::string("unrecognized"), "label");
}

int main() {
    testIdentity();
    testPowerForEveryZone();
    testZoneFields();
    testQuotedTextIsNotAVerb();
    testInputSlotNames();
    testUnrecognized();
    return finishTests("AnthemResponse");
}
