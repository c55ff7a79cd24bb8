// Tests for adb / emulator output parsing and the template merge.

#include <string>
#include <vector>

#include "devices/device_identity.hpp"
#include "devices/emulator/emulator_parser.hpp"
#include "test_support.hpp"

using test_support::expect;

namespace test_emulator_parser {

static bool test_running_instances() {
    std::string output =
        "List of devices attached\n"
        "emulator-5554          device product:sdk_gphone64_arm64 model:sdk_gphone64 device:emu64a transport_id:1\n"
        "emulator-5556          offline\n"
        "R58M12345             device usb:1-1 product:beyond1 model:SM_G973F device:beyond1\n"
        "emulator-5558 device\n"
        "\n";
    std::vector<emulator::RunningInstance> instances = emulator::parse_running_instances(output);
    bool success = instances.size() == 2 &&
                   instances[0].serial == "emulator-5554" && instances[0].port == "5554" &&
                   instances[0].device_field == "emu64a" &&
                   instances[1].serial == "emulator-5558" && instances[1].device_field.empty();
    return expect(success, "Only ready emulator lines are kept, with port and device field");
}

static bool test_template_names() {
    std::vector<std::string> names = emulator::parse_template_names(
        "Pixel_7_API_34\n\nINFO    | Storing crashdata in: /tmp/foo\n  Tablet_API_33  \n");
    bool success = names.size() == 2 && names[0] == "Pixel_7_API_34" && names[1] == "Tablet_API_33";
    return expect(success, "Template names are trimmed and diagnostic lines skipped");
}

static bool test_console_avd_name() {
    bool success = emulator::parse_console_avd_name("Pixel_7_API_34\nOK\n") == "Pixel_7_API_34" &&
                   emulator::parse_console_avd_name("OK\nPixel_7_API_34\n") == "Pixel_7_API_34" &&
                   emulator::parse_console_avd_name("KO: unknown command\n").empty() &&
                   emulator::parse_console_avd_name("").empty();
    return expect(success, "Console avd name skips OK and rejects KO");
}

static bool test_fallback_name() {
    emulator::RunningInstance with_field{"emulator-5554", "5554", "emu64a"};
    emulator::RunningInstance without_field{"emulator-5560", "5560", ""};
    return expect(emulator::fallback_instance_name(with_field) == "emu64a" &&
                      emulator::fallback_instance_name(without_field) == "Emulator 5560",
                  "Fallback name uses the device field, then the console port");
}

static bool test_api_level_from_name() {
    bool success = emulator::api_level_from_name("Pixel_7_API_34") == "34" &&
                   emulator::api_level_from_name("pixel_api31") == "31" &&
                   emulator::api_level_from_name("MyAndroid30") == "30" &&
                   emulator::api_level_from_name("Tablet2") == "2" &&
                   emulator::api_level_from_name("Tablet").empty();
    return expect(success, "API level is inferred from common AVD naming patterns");
}

static bool test_avd_config() {
    std::string config =
        "avd.ini.encoding=UTF-8\n"
        "hw.device.name=pixel_7\n"
        "image.sysdir.1=system-images/android-33/google_apis/arm64-v8a/\n";
    emulator::TemplateMetadata metadata = emulator::parse_avd_config(config, "Pixel_7_API_34");
    emulator::TemplateMetadata target = emulator::parse_avd_config("target=android-30\n", "Old_Device");
    emulator::TemplateMetadata empty = emulator::parse_avd_config("", "Phone_API_29");
    bool success = metadata.api_level == "33" && metadata.device_name == "pixel 7" &&
                   target.api_level == "30" && target.device_name == "Old_Device" &&
                   empty.api_level == "29";
    return expect(success, "config.ini API level wins over the name; hw.device.name is humanized");
}

static bool test_android_versions() {
    bool success = emulator::android_version_for_api("34") == "14.0" &&
                   emulator::android_version_for_api("24") == "7.0" &&
                   emulator::android_version_for_api("21") == "6.4" &&
                   emulator::android_version_for_api("").empty() &&
                   emulator::android_version_for_api("UpsideDownCake").empty();
    return expect(success, "Known API levels map exactly, others are estimated");
}

static bool test_template_prefix() {
    return expect(emulator::strip_template_prefix("avd:Pixel_7") == "Pixel_7" &&
                      emulator::strip_template_prefix("Pixel_7") == "Pixel_7",
                  "Template prefix is stripped when present");
}

static bool test_merge_identity_and_enrichment() {
    emulator::TemplateMetadata metadata;
    metadata.api_level = "34";
    metadata.device_name = "pixel 7";
    devices::Device pixel_template = emulator::make_template_device("Pixel_7_API_34", metadata);
    devices::Device tablet_template = emulator::make_template_device("Tablet_API_33", {"33", "Tablet_API_33"});
    devices::Device pixel_running = emulator::make_running_device("Pixel_7_API_34", "emulator-5554");
    devices::Device duplicate = emulator::make_running_device("Pixel_7_API_34", "emulator-5556");

    std::vector<devices::Device> merged = emulator::merge_devices({pixel_running, duplicate},
                                                                  {pixel_template, tablet_template});
    bool success = merged.size() == 2 &&
                   merged[0].id == pixel_template.id &&
                   merged[0].id == devices::derive_device_id("Pixel_7_API_34-android") &&
                   merged[0].state == devices::DeviceState::Booted &&
                   merged[0].native_identifier == std::string("emulator-5554") &&
                   merged[0].os_version == std::string("Android 14.0") &&
                   merged[0].attributes.at("apiLevel") == "34" &&
                   merged[0].attributes.at("source") == "running" &&
                   merged[1].name == "Tablet_API_33" &&
                   merged[1].state == devices::DeviceState::Shutdown &&
                   !merged[1].native_identifier.has_value();
    return expect(success, "Running instance shares its template id and picks up template metadata");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_running_instances();
    all_passed &= test_template_names();
    all_passed &= test_console_avd_name();
    all_passed &= test_fallback_name();
    all_passed &= test_api_level_from_name();
    all_passed &= test_avd_config();
    all_passed &= test_android_versions();
    all_passed &= test_template_prefix();
    all_passed &= test_merge_identity_and_enrichment();
    return all_passed;
}

} // namespace test_emulator_parser
