#include <gtest/gtest.h>
#include <clipstash/settings.hpp>

using namespace clipstash;

TEST(SettingsTest, DefaultsAreValid) {
    Settings settings;
    EXPECT_TRUE(settings.validate().ok()) << settings.validate().error().to_string();
    EXPECT_TRUE(settings.remember_history);
    EXPECT_FALSE(settings.incognito_mode);
    EXPECT_EQ(settings.keyboard_shortcut.display, "Ctrl+Shift+V");
}

TEST(SettingsTest, EffectiveHistoryLimit) {
    Settings settings;
    settings.enable_history_limit = false;
    settings.max_history_items = 20;
    EXPECT_EQ(settings.effective_history_limit(), 500u);

    settings.enable_history_limit = true;
    EXPECT_EQ(settings.effective_history_limit(), 20u);

    settings.max_history_items = 3;
    EXPECT_EQ(settings.effective_history_limit(), 10u);

    settings.max_history_items = 5000;
    EXPECT_EQ(settings.effective_history_limit(), 500u);
}

TEST(SettingsTest, RangeValidation) {
    Settings settings;
    settings.max_history_items = 0;
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_RANGE_INVALID);

    settings = Settings();
    settings.font_size_scale = 4.0;
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_RANGE_INVALID);

    settings = Settings();
    settings.auto_show_delay = -1.0;
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_RANGE_INVALID);

    settings = Settings();
    settings.density_mode = "roomy";
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_RANGE_INVALID);

    settings = Settings();
    settings.theme_override = "purple";
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_RANGE_INVALID);
}

TEST(SettingsTest, ShortcutValidation) {
    Settings settings;
    settings.keyboard_shortcut.modifiers = MODIFIER_NONE;
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_SHORTCUT_INVALID);

    settings = Settings();
    settings.keyboard_shortcut.key_code = 0;
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_SHORTCUT_INVALID);

    settings = Settings();
    settings.keyboard_shortcut.display = " ";
    EXPECT_EQ(settings.validate().error_code(), ErrorCode::SETTINGS_SHORTCUT_INVALID);
}

TEST(KeyboardShortcutTest, Parse) {
    auto shortcut = KeyboardShortcut::parse("ctrl + alt + k");
    ASSERT_TRUE(shortcut.has_value());
    EXPECT_EQ(shortcut->key_code, static_cast<uint32_t>('K'));
    EXPECT_EQ(shortcut->modifiers, MODIFIER_CONTROL | MODIFIER_ALT);
    EXPECT_EQ(shortcut->display, "Ctrl+Alt+K");

    auto space = KeyboardShortcut::parse("Super+Space");
    ASSERT_TRUE(space.has_value());
    EXPECT_EQ(space->display, "Super+Space");

    EXPECT_FALSE(KeyboardShortcut::parse("Hyper+V").has_value());
    EXPECT_FALSE(KeyboardShortcut::parse("Ctrl+Enter").has_value());
    EXPECT_FALSE(KeyboardShortcut::parse("").has_value());
}

TEST(SettingsTest, ExcludedSources) {
    Settings settings;
    settings.excluded_app_ids = {"com.example.Vault", "KeePassXC"};

    EXPECT_TRUE(settings.is_excluded_source(std::string("com.example.vault")));
    EXPECT_TRUE(settings.is_excluded_source(std::string("keepassxc.exe")));
    EXPECT_TRUE(settings.is_excluded_source(std::string(" KeePassXC.desktop ")));
    EXPECT_FALSE(settings.is_excluded_source(std::string("org.gnome.Terminal")));
    EXPECT_FALSE(settings.is_excluded_source(std::nullopt));
}

TEST(SettingsTest, Equality) {
    Settings a;
    Settings b;
    EXPECT_EQ(a, b);
    b.incognito_mode = true;
    EXPECT_NE(a, b);
}
