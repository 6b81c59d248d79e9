#include "settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace {

unsigned long parse_positive(const char* name, const char* value) {
    std::string text(value);
    std::size_t used = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(text, &used);
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a number: " + text);
    }
    if (used != text.size() || parsed == 0 || text.front() == '-') {
        throw ConfigError(std::string(name) + " must be a positive integer: " + text);
    }
    return parsed;
}

} // namespace

AssistantSettings AssistantSettings::from_env() {
    AssistantSettings settings;

    if (const char* device = std::getenv("HARK_AUDIO_DEVICE")) {
        if (*device) settings.device = device;
    }
    if (const char* frames = std::getenv("HARK_FRAMES_PER_BUFFER")) {
        settings.frames_per_buffer =
            static_cast<unsigned>(parse_positive("HARK_FRAMES_PER_BUFFER", frames));
    }
    if (const char* timeout = std::getenv("HARK_RECOGNITION_TIMEOUT")) {
        settings.recognition_timeout =
            std::chrono::seconds(parse_positive("HARK_RECOGNITION_TIMEOUT", timeout));
    }
    return settings;
}

std::string config_dir() {
    std::filesystem::path dir;
    if (const char* env = std::getenv("HARK_CONFIG_DIR"); env && *env) {
        dir = env;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        dir = std::filesystem::path(home) / ".config" / "hark";
    } else {
        throw ConfigError("Neither HARK_CONFIG_DIR nor HOME is set");
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ConfigError("Failed to create config directory " + dir.string() + ": " + ec.message());
    }
    return dir.string();
}

std::string config_file(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / name).string();
}
