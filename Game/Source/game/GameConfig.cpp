#include "GameConfig.hpp"

#include <iostream>
#include <stdexcept>

namespace {
    float ParseFloat(const std::string& flag, const std::string& value) {
        size_t used = 0;
        float result = 0.0f;
        try {
            result = std::stof(value, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
        }
        if (used != value.size()) {
            throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
        }
        return result;
    }

    int ParseInt(const std::string& flag, const std::string& value) {
        size_t used = 0;
        int result = 0;
        try {
            result = std::stoi(value, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
        }
        if (used != value.size()) {
            throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
        }
        return result;
    }

    float ParseVolume(const std::string& flag, const std::string& value) {
        float v = ParseFloat(flag, value);
        if (v < 0.0f || v > 1.0f) {
            throw std::invalid_argument(flag + " must be within [0, 1]");
        }
        return v;
    }
}

LaunchOptions ParseLaunchOptions(const std::vector<std::string>& args) {
    LaunchOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(a + " requires a value");
            }
            return args[++i];
        };

        if (a == "--help") {
            options.showHelp = true;
        } else if (a == "--width") {
            options.game.playfield.width = static_cast<float>(ParseInt(a, next()));
            if (options.game.playfield.width <= 0.0f) throw std::invalid_argument("--width must be positive");
        } else if (a == "--height") {
            options.game.playfield.height = static_cast<float>(ParseInt(a, next()));
            if (options.game.playfield.height <= 0.0f) throw std::invalid_argument("--height must be positive");
        } else if (a == "--assets") {
            options.assetsDir = next();
        } else if (a == "--fps") {
            options.fpsCap = ParseInt(a, next());
            if (options.fpsCap < 0) throw std::invalid_argument("--fps must not be negative");
        } else if (a == "--music-volume") {
            options.musicVolume = ParseVolume(a, next());
        } else if (a == "--sfx-volume") {
            options.sfxVolume = ParseVolume(a, next());
        } else if (a == "--no-console-log") {
            options.consoleLog = false;
        } else {
            throw std::invalid_argument("Unknown option: " + a);
        }
    }

    return options;
}

void PrintHelp() {
    std::cout << "Usage:\n"
        << "  --width <px>               Playfield and window width (default: 1280).\n"
        << "  --height <px>              Playfield and window height (default: 1024).\n"
        << "  --assets <dir>             Asset folder with images/ and sounds/ (default: assets).\n"
        << "  --fps <cap>                Frame rate cap, 0 for uncapped (default: 0).\n"
        << "  --music-volume <0..1>      Initial music volume (default: 0.6).\n"
        << "  --sfx-volume <0..1>        Initial sound effect volume (default: 0.9).\n"
        << "  --no-console-log           Only write the log file.\n"
        << "  --help                     Show this help message.\n"
        << "\nControls:\n"
        << "  Menu:     Up/Down select, Left/Right volume, Enter start, Esc quit\n"
        << "  In game:  Left/Right rotate, Up thrust, Space shoot, H hyperspace, Esc/Q quit\n";
}
