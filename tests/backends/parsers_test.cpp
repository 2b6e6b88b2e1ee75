#include "qadt/backends/parsers.hpp"

#include <gtest/gtest.h>

using namespace qadt::backends;
using qadt::device::ConnectionState;
using qadt::device::Device;
using qadt::device::PlatformKind;

TEST(Parsers, AdbDevices) {
    const std::string output =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "SER123          device usb:1-1 product:panther model:Pixel_7 device:panther transport_id:1\r\n"
        "emulator-5554   unauthorized transport_id:2\n"
        "192.168.1.5:5555 offline\n"
        "\n";

    const auto devices = parse_adb_devices(output);
    ASSERT_EQ(devices.size(), 3u);

    EXPECT_EQ(devices[0].id, "SER123");
    EXPECT_EQ(devices[0].model, "Pixel 7");
    EXPECT_EQ(devices[0].display_name, "panther");
    EXPECT_EQ(devices[0].connection_state, ConnectionState::Online);
    EXPECT_EQ(devices[0].platform, PlatformKind::Android);

    EXPECT_EQ(devices[1].id, "emulator-5554");
    EXPECT_EQ(devices[1].connection_state, ConnectionState::Unauthorized);
    EXPECT_EQ(devices[2].connection_state, ConnectionState::Offline);
}

TEST(Parsers, AdbDevicesEmpty) {
    EXPECT_TRUE(parse_adb_devices("List of devices attached\n\n").empty());
    EXPECT_TRUE(parse_adb_devices("").empty());
}

TEST(Parsers, BatteryLevel) {
    const std::string output =
        "Current Battery Service state:\n"
        "  AC powered: false\n"
        "  USB powered: true\n"
        "  level: 87\n"
        "  scale: 100\n";
    EXPECT_EQ(parse_battery_level(output), 87);
    EXPECT_FALSE(parse_battery_level("no battery here").has_value());
}

TEST(Parsers, IdeviceInfo) {
    Device base;
    base.id = "00008030-001A";
    base.platform = PlatformKind::iOS;

    const std::string output =
        "ActivationState: Activated\n"
        "DeviceName: QA iPhone\n"
        "ProductType: iPhone14,2\n"
        "ProductVersion: 17.4.1\n"
        "BatteryCurrentCapacity: 64\n";
    const auto device = parse_ideviceinfo(output, base);
    EXPECT_EQ(device.id, "00008030-001A");
    EXPECT_EQ(device.display_name, "QA iPhone");
    EXPECT_EQ(device.model, "iPhone14,2");
    EXPECT_EQ(device.os_version, "17.4.1");
    EXPECT_EQ(device.battery_level, "64%");

    const auto sparse = parse_ideviceinfo("", base);
    EXPECT_EQ(sparse.model, "iOS Device");
    EXPECT_EQ(sparse.battery_level, "N/A");
}

TEST(Parsers, PendingTrust) {
    EXPECT_TRUE(indicates_pending_trust("ERROR: Could not connect to lockdownd, error code -19"));
    EXPECT_TRUE(indicates_pending_trust("could not connect to device"));
    EXPECT_FALSE(indicates_pending_trust("DeviceName: QA iPhone\n"));
}

TEST(Parsers, LsLongIsoLayout) {
    const std::string output =
        "total 24\n"
        "drwxrwx--x 4 root sdcard_rw 4096 2026-01-01 12:00 .\n"
        "drwxrwx--x 4 root sdcard_rw 4096 2026-01-01 12:00 ..\n"
        "-rw-rw---- 1 root sdcard_rw 1234 2026-01-02 09:30 notes.txt\n"
        "drwxrwx--x 2 root sdcard_rw 4096 2026-01-01 12:00 Download\n"
        "-rw-rw---- 1 root sdcard_rw   99 2026-01-02 09:31 my report.pdf\n"
        "lrwxrwxrwx 1 root root        21 2026-01-01 12:00 sdcard -> /storage/self/primary\n";

    const auto entries = parse_ls_long(output, "/sdcard/");
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].name, "Download");
    EXPECT_TRUE(entries[0].is_directory);
    EXPECT_EQ(entries[0].path, "/sdcard/Download");

    EXPECT_EQ(entries[1].name, "my report.pdf");
    EXPECT_EQ(entries[1].size, 99u);
    EXPECT_EQ(entries[2].name, "notes.txt");
    EXPECT_EQ(entries[2].size, 1234u);
    EXPECT_EQ(entries[3].name, "sdcard");
    EXPECT_FALSE(entries[3].is_directory);
}

TEST(Parsers, LsLongClassicLayout) {
    const std::string output =
        "-rw-r--r--  1 mobile  mobile  2048 Jan 02 09:30 2026 photo.jpg\n"
        "drwxr-xr-x  3 mobile  mobile    96 Jan 01 12:00 2026 DCIM\n";

    const auto entries = parse_ls_long(output, "/");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "DCIM");
    EXPECT_EQ(entries[0].path, "/DCIM");
    EXPECT_EQ(entries[1].name, "photo.jpg");
    EXPECT_EQ(entries[1].size, 2048u);
}

TEST(Parsers, LsLongIgnoresErrorsAndColors) {
    const std::string output =
        "ls: /data: Permission denied\n"
        "\x1B[0;34m-rw-r--r-- 1 root root 5 2026-01-01 12:00 a.txt\x1B[0m\n";
    const auto entries = parse_ls_long(output, "/data/local/tmp");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, "/data/local/tmp/a.txt");
}

TEST(Parsers, PmPackages) {
    const std::string output =
        "package:com.zeta.app\n"
        "package:/data/app/~~abc==/com.alpha.app-1/base.apk=com.alpha.app\n"
        "garbage\n"
        "package:\n";
    const auto apps = parse_pm_packages(output);
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps[0].package_id, "com.alpha.app");
    EXPECT_EQ(apps[1].package_id, "com.zeta.app");
    EXPECT_EQ(apps[1].platform, PlatformKind::Android);
}

TEST(Parsers, IdeviceInstallerList) {
    const std::string output =
        "CFBundleIdentifier, CFBundleVersion, CFBundleDisplayName\n"
        "com.example.zulu, \"2.0\", \"Zulu\"\n"
        "com.example.alpha, \"1.2.3\", \"Alpha, Deluxe\"\n"
        "com.example.bare\n";
    const auto apps = parse_ideviceinstaller_list(output);
    ASSERT_EQ(apps.size(), 3u);

    EXPECT_EQ(apps[0].name, "Alpha, Deluxe");
    EXPECT_EQ(apps[0].version, "1.2.3");
    EXPECT_EQ(apps[0].platform, PlatformKind::iOS);
    EXPECT_EQ(apps[1].name, "Zulu");
    EXPECT_EQ(apps[2].name, "com.example.bare");
    EXPECT_EQ(apps[2].version, "");
}

TEST(Parsers, ExtractVersion) {
    EXPECT_EQ(extract_version("Android Debug Bridge version 1.0.41\nVersion 35.0.1"), "1.0.41");
    EXPECT_EQ(extract_version("scrcpy 2.4 <https://github.com/Genymobile/scrcpy>"), "2.4");
    EXPECT_FALSE(extract_version("no digits").has_value());
}

TEST(Parsers, ShellQuote) {
    EXPECT_EQ(shell_quote("/sdcard/My Files"), "'/sdcard/My Files'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(Parsers, InetAddress) {
    const std::string output =
        "34: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc mq state UP group default qlen 3000\n"
        "    inet 192.168.1.23/24 brd 192.168.1.255 scope global wlan0\n"
        "       valid_lft forever preferred_lft forever\n";
    EXPECT_EQ(parse_inet_address(output), "192.168.1.23");
    EXPECT_FALSE(parse_inet_address("Device \"wlan0\" does not exist.\n").has_value());
}

TEST(Parsers, AdbConnectReply) {
    EXPECT_TRUE(adb_connect_succeeded("connected to 192.168.1.23:5555\n"));
    EXPECT_TRUE(adb_connect_succeeded("already connected to 192.168.1.23:5555\n"));
    EXPECT_FALSE(adb_connect_succeeded("failed to connect to '10.0.0.9:5555': Connection refused\n"));
    EXPECT_FALSE(adb_connect_succeeded("cannot connect to 10.0.0.9:5555: No route to host\n"));
    EXPECT_FALSE(adb_connect_succeeded(""));
}

TEST(Parsers, AmStartReply) {
    EXPECT_TRUE(am_start_succeeded("Starting: Intent { act=android.intent.action.VIEW dat=https://example.com/... }\n"));
    EXPECT_TRUE(am_start_succeeded(
        "Starting: Intent { act=android.intent.action.VIEW }\n"
        "Warning: Activity not started, intent has been delivered to currently running top-most instance.\n"));
    EXPECT_FALSE(am_start_succeeded(
        "Starting: Intent { act=android.intent.action.VIEW dat=nothing://here }\n"
        "Error: Activity not started, unable to resolve Intent { act=android.intent.action.VIEW }\n"));
}

TEST(Parsers, Vitals) {
    const std::string meminfo =
        "Applications Memory Usage (in Kilobytes):\n"
        "Uptime: 123456 Realtime: 123456\n"
        "\n"
        "Total PSS by process:\n"
        "    312,044K: system (pid 1234)\n"
        "\n"
        "Total RAM: 7,651,088K (status normal)\n"
        " Free RAM: 3,452,996K ( 1,084,920K cached pss +   2,368,076K cached kernel)\n"
        " Used RAM: 4,013,836K ( 3,211,372K used pss +     802,464K kernel)\n"
        " Lost RAM:   184,254K\n";
    std::string top = "Tasks: 400 total\n";
    for (int i = 0; i < 30; ++i) {
        top += "  " + std::to_string(1000 + i) + " u0_a1 S com.example." + std::to_string(i) + "\n";
    }

    const auto vitals = parse_vitals(meminfo, top, 5);
    EXPECT_EQ(vitals.total_ram_kb, 7651088u);
    EXPECT_EQ(vitals.free_ram_kb, 3452996u);
    EXPECT_EQ(vitals.used_ram_kb, 4013836u);
    EXPECT_EQ(vitals.memory_summary.rfind("Total RAM: 7,651,088K", 0), 0u);
    EXPECT_NE(vitals.memory_summary.find("Lost RAM"), std::string::npos);
    EXPECT_EQ(vitals.memory_summary.find("Total PSS"), std::string::npos);
    EXPECT_EQ(vitals.top_processes,
              "Tasks: 400 total\n  1000 u0_a1 S com.example.0\n  1001 u0_a1 S com.example.1\n"
              "  1002 u0_a1 S com.example.2\n  1003 u0_a1 S com.example.3");

    const auto empty = parse_vitals("", "");
    EXPECT_TRUE(empty.memory_summary.empty());
    EXPECT_FALSE(empty.total_ram_kb.has_value());
    EXPECT_TRUE(empty.top_processes.empty());
}

TEST(Parsers, SplitCommandLine) {
    using Args = std::vector<std::string>;
    EXPECT_EQ(split_command_line("shell ls -l /sdcard"), (Args{"shell", "ls", "-l", "/sdcard"}));
    EXPECT_EQ(split_command_line("  shell   \"echo a  b\" 'c d'  "), (Args{"shell", "echo a  b", "c d"}));
    EXPECT_EQ(split_command_line("push file\\ name"), (Args{"push", "file\\", "name"}));
    EXPECT_EQ(split_command_line("shell ''"), (Args{"shell", ""}));
    EXPECT_EQ(split_command_line("shell \"unterminated arg"), (Args{"shell", "unterminated arg"}));
    EXPECT_TRUE(split_command_line(" \t ").empty());
}
