//=============================================================================
// Config Tests
//=============================================================================

#include <boost/ut.hpp>
#include <yframe/config.h>
#include <yframe/term-caps.h>
#include <yframe/terminal-options.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace boost::ut;
using namespace yframe;

namespace {

std::filesystem::path writeTempConfig(const std::string& content) {
    auto path = std::filesystem::temp_directory_path() /
                ("yframe-config-test-" + std::to_string(getpid()) + ".yaml");
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        auto config = Config::create("", YAML::Node());
        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<bool>(Config::KEY_RENDERING_BATCHED, false));
        expect((*config)->get<bool>(Config::KEY_RENDERING_COALESCE, false));
        expect(!(*config)->get<bool>("caps.truecolor").has_value());
    };

    "file values override defaults"_test = [] {
        auto path = writeTempConfig("rendering:\n  batched: false\ncaps:\n  sixel: true\n");
        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(config.has_value());
        if (!config) return;
        expect(!(*config)->get<bool>(Config::KEY_RENDERING_BATCHED, true));
        expect((*config)->get<bool>(Config::KEY_RENDERING_COALESCE, false));
        expect((*config)->get<bool>("caps.sixel", false));
    };

    "missing explicit file is an error"_test = [] {
        auto config = Config::create("/nonexistent/yframe/config.yaml");
        expect(!config.has_value());
    };

    "malformed file is an error"_test = [] {
        auto path = writeTempConfig("rendering: [unclosed\n");
        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(!config.has_value());
    };

    "command line overrides win"_test = [] {
        YAML::Node overrides;
        overrides["terminal"]["alt-screen"] = false;
        auto config = Config::create("", overrides);
        expect(config.has_value());
        if (!config) return;
        expect(!(*config)->get<bool>(Config::KEY_TERMINAL_ALT_SCREEN, true));
        expect((*config)->get<bool>(Config::KEY_TERMINAL_HIDE_CURSOR, false));
    };

    "environment overrides"_test = [] {
        setenv("YFRAME_RENDERING_SYNC_OUTPUT", "0", 1);
        setenv("YFRAME_CAPS_KITTY_GRAPHICS", "1", 1);
        auto config = Config::create("", YAML::Node());
        unsetenv("YFRAME_RENDERING_SYNC_OUTPUT");
        unsetenv("YFRAME_CAPS_KITTY_GRAPHICS");
        expect(config.has_value());
        if (!config) return;
        expect(!(*config)->get<bool>(Config::KEY_RENDERING_SYNC_OUTPUT, true));
        expect((*config)->get<bool>("caps.kitty-graphics", false));
    };

    "wrong type reads as missing"_test = [] {
        YAML::Node overrides;
        overrides["rendering"]["batched"] = "sometimes";
        auto config = Config::create("", overrides);
        expect(config.has_value());
        if (!config) return;
        expect(!(*config)->get<bool>(Config::KEY_RENDERING_BATCHED).has_value());
    };

    "terminal options from config"_test = [] {
        YAML::Node overrides;
        overrides["rendering"]["batched"] = false;
        overrides["terminal"]["mouse"] = true;
        auto config = Config::create("", overrides);
        expect(config.has_value());
        if (!config) return;
        auto options = TerminalOptions::fromConfig(**config);
        expect(!options.batched);
        expect(options.mouse);
        expect(options.coalesce);
    };

    "capability overrides"_test = [] {
        YAML::Node overrides;
        overrides["caps"]["truecolor"] = false;
        overrides["caps"]["kitty-graphics"] = true;
        overrides["caps"]["width-method"] = "wcwidth";
        auto config = Config::create("", overrides);
        expect(config.has_value());
        if (!config) return;

        TermCaps caps;
        caps.truecolor = true;
        TermCaps result = applyCapsOverrides(caps, **config);
        expect(!result.truecolor);
        expect(result.kittyGraphics);
        expect(result.widthMethod == WidthMethod::Wcwidth);
    };
};
