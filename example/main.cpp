#include <libtextkit/capitalize.hpp>
#include <libtextkit/logger.hpp>
#include <libtextkit/serde/decoder.hpp>
#include <libtextkit/serde/trim.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

// Example record: both fields are whitespace-normalized while decoding
struct Headline {
    std::string title;
    std::optional<std::string> subtitle;

    static auto decode(const Json::Value& json) -> Headline {
        textkit::serde::ObjectDecoder object(json);
        return {object.field("title", textkit::serde::trim_string),
                object.field("subtitle", textkit::serde::trim_optional_string)};
    }
};

auto parse_level(std::string_view name) -> std::optional<textkit::LogLevel> {
    if (name == "none") {
        return textkit::LogLevel::NONE;
    }
    if (name == "error") {
        return textkit::LogLevel::ERROR;
    }
    if (name == "warn") {
        return textkit::LogLevel::WARN;
    }
    if (name == "info") {
        return textkit::LogLevel::INFO;
    }
    if (name == "debug") {
        return textkit::LogLevel::DEBUG;
    }
    if (name == "trace") {
        return textkit::LogLevel::TRACE;
    }
    return std::nullopt;
}

void print_usage(const char* program) {
    std::cerr << "usage: " << program
              << " [--log-level none|error|warn|info|debug|trace] [--log-format text|json]"
                 " [--log-backend stdout|syslog] [FILE]"
              << std::endl;
}

} // namespace

auto main(int argc, char** argv) -> int {
    auto level = textkit::LogLevel::WARN;
    auto format = textkit::LogFormat::TEXT;
    auto backend = textkit::LogBackend::STDOUT;
    std::string path;

    if (const char* env_level = std::getenv("TEXTKIT_LOG_LEVEL")) {
        if (auto parsed = parse_level(env_level)) {
            level = *parsed;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            auto parsed = parse_level(argv[++i]);
            if (!parsed) {
                print_usage(argv[0]);
                return 2;
            }
            level = *parsed;
        } else if (arg == "--log-format" && i + 1 < argc) {
            std::string_view value = argv[++i];
            if (value == "json") {
                format = textkit::LogFormat::JSON;
            } else if (value == "text") {
                format = textkit::LogFormat::TEXT;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        } else if (arg == "--log-backend" && i + 1 < argc) {
            std::string_view value = argv[++i];
            if (value == "syslog") {
                backend = textkit::LogBackend::SYSLOG;
            } else if (value == "stdout") {
                backend = textkit::LogBackend::STDOUT;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.starts_with("-") && path.empty()) {
            path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    textkit::Logger::instance().initialize(level, backend, format, "textkit-demo");

    std::string input;
    if (path.empty()) {
        input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            TEXTKIT_ERROR("cannot open {}", path);
            return 1;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        input = contents.str();
    }
    TEXTKIT_DEBUG("read {} bytes from {}", input.size(), path.empty() ? "stdin" : path);

    try {
        auto headline = Headline::decode(textkit::serde::parse_document(input));

        std::cout << textkit::capitalize(headline.title) << std::endl;
        if (headline.subtitle) {
            std::cout << textkit::capitalize_untrimmed(*headline.subtitle) << std::endl;
        } else {
            std::cout << "<none>" << std::endl;
        }
    } catch (const textkit::serde::DecodeError& error) {
        TEXTKIT_ERROR("decode failed: {}", error.what());
        return 1;
    }

    return 0;
}
