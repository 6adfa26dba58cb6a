#include <gtest/gtest.h>
#include <core/constants.hpp>
#include <core/settings.hpp>
#include <core/utils.hpp>

TEST(Settings, AggressivePreset) {
    auto s = Settings::aggressive();
    EXPECT_EQ(s.preset, "aggressive");
    EXPECT_EQ(s.timeout, Millis(1000));
    EXPECT_EQ(s.connect_timeout, Millis(1000));
    EXPECT_EQ(s.retries, 2);
    EXPECT_EQ(s.retry_delay, Millis(250));
    EXPECT_EQ(s.max_service_wait, Millis(15000));
    EXPECT_TRUE(s.validate().is_ok());
}

TEST(Settings, ConservativePreset) {
    auto s = Settings::conservative();
    EXPECT_EQ(s.timeout, Millis(5000));
    EXPECT_EQ(s.retries, 3);
    EXPECT_EQ(s.retry_delay, Millis(1000));
    EXPECT_EQ(s.auth_retries, 1);
    EXPECT_TRUE(s.validate().is_ok());
}

TEST(Settings, BackoffDefaultsShared) {
    auto a = Settings::aggressive();
    auto c = Settings::conservative();
    EXPECT_EQ(a.probe_base_delay, Millis(500));
    EXPECT_EQ(a.probe_backoff_cap, Millis(4000));
    EXPECT_DOUBLE_EQ(a.probe_jitter, 0.2);
    EXPECT_EQ(a.probe_base_delay, c.probe_base_delay);
    EXPECT_EQ(a.probe_backoff_cap, c.probe_backoff_cap);
}

TEST(Settings, PresetAliases) {
    EXPECT_EQ(preset_settings("v1").value.preset, "aggressive");
    EXPECT_EQ(preset_settings("V2").value.preset, "conservative");
    EXPECT_EQ(preset_settings("").value.preset, "aggressive");
    EXPECT_TRUE(preset_settings("turbo").is_err());
}

TEST(Settings, NegativeRetriesRejected) {
    SettingsOverrides o;
    o.retries = -1;
    auto r = make_settings("aggressive", o);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("retries"), std::string::npos);
}

TEST(Settings, ZeroTimeoutRejected) {
    auto s = Settings::aggressive();
    s.read_timeout = Millis(0);
    EXPECT_TRUE(s.validate().is_err());
}

TEST(Settings, ZeroConcurrencyRejected) {
    SettingsOverrides o;
    o.max_concurrency = 0;
    EXPECT_TRUE(make_settings("conservative", o).is_err());
}

TEST(Settings, JitterOutOfRangeRejected) {
    auto s = Settings::aggressive();
    s.probe_jitter = 1.0;
    EXPECT_TRUE(s.validate().is_err());
    s.probe_jitter = 0.0;
    EXPECT_TRUE(s.validate().is_ok());
}

TEST(Settings, ZeroRetriesAllowed) {
    SettingsOverrides o;
    o.retries = 0;
    auto r = make_settings("aggressive", o);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.retries, 0);
}

TEST(Settings, OverridesOnlyTouchSetFields) {
    SettingsOverrides o;
    o.timeout = Millis(2500);
    auto r = make_settings("conservative", o);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.timeout, Millis(2500));
    EXPECT_EQ(r.value.connect_timeout, Millis(5000));
    EXPECT_EQ(r.value.retries, 3);
}

TEST(Settings, MergeLaterWins) {
    SettingsOverrides file;
    file.retries = 4;
    file.max_concurrency = 2;

    SettingsOverrides flags;
    flags.retries = 1;

    file.merge(flags);
    EXPECT_EQ(*file.retries, 1);
    EXPECT_EQ(*file.max_concurrency, 2);
}

TEST(Settings, ParseDuration) {
    EXPECT_EQ(parse_duration("1.5").value, Millis(1500));
    EXPECT_EQ(parse_duration("250ms").value, Millis(250));
    EXPECT_EQ(parse_duration("2s").value, Millis(2000));
    EXPECT_EQ(parse_duration("1m").value, Millis(60000));
    EXPECT_TRUE(parse_duration("").is_err());
    EXPECT_TRUE(parse_duration("fast").is_err());
    EXPECT_TRUE(parse_duration("3h").is_err());
}

TEST(Settings, ParseDurationRejectsHugeValues) {
    EXPECT_TRUE(parse_duration("1e10").is_err());
    EXPECT_TRUE(parse_duration("1e300ms").is_err());
    EXPECT_TRUE(parse_duration("-5").is_err());
    // 30 days is the longest value any field accepts
    EXPECT_EQ(parse_duration("43200m").value, Millis(MAX_CREDENTIAL_TTL_SECS * 1000));
    EXPECT_TRUE(parse_duration("43201m").is_err());
}

TEST(Settings, TimingsCappedAtOneDay) {
    SettingsOverrides o;
    o.max_service_wait = std::chrono::hours(25);
    auto r = make_settings("aggressive", o);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("max_service_wait"), std::string::npos);

    o.max_service_wait = Millis(MAX_DURATION_MS);
    EXPECT_TRUE(make_settings("aggressive", o).is_ok());
}

TEST(Settings, CredentialTtlCapped) {
    auto s = Settings::aggressive();
    s.credential_ttl = std::chrono::seconds(MAX_CREDENTIAL_TTL_SECS + 1);
    EXPECT_TRUE(s.validate().is_err());
    s.credential_ttl = std::chrono::seconds(MAX_CREDENTIAL_TTL_SECS);
    EXPECT_TRUE(s.validate().is_ok());
}

TEST(Utils, ParsePortList) {
    auto r = parse_port_list("22, 23,21,22");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<int>{22, 23, 21}));

    EXPECT_TRUE(parse_port_list("").is_err());
    EXPECT_TRUE(parse_port_list("22,0").is_err());
    EXPECT_TRUE(parse_port_list("70000").is_err());
    EXPECT_TRUE(parse_port_list("ssh").is_err());
}

TEST(Utils, SafeStoiIsStrict) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("42x", -1), -1);
    EXPECT_EQ(safe_stoi("", -1), -1);
}
