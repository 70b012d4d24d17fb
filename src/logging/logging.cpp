#include <scenelink/logging/HostConsoleSink.h>
#include <scenelink/logging/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace scenelink::logging {

std::vector<std::string> wrapText(std::string_view text, std::size_t width) {
    std::vector<std::string> lines;
    if (width == 0) {
        lines.emplace_back(text);
        return lines;
    }

    std::string current;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        if (pos >= text.size())
            break;
        std::size_t end = pos;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
            ++end;
        std::string_view word = text.substr(pos, end - pos);
        pos = end;

        if (!current.empty() && current.size() + 1 + word.size() <= width) {
            current += ' ';
            current.append(word);
            continue;
        }
        if (!current.empty()) {
            lines.push_back(std::move(current));
            current.clear();
        }
        // split words that do not fit on a line of their own
        while (word.size() > width) {
            lines.emplace_back(word.substr(0, width));
            word.remove_prefix(width);
        }
        current.assign(word);
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "critical")
        return spdlog::level::critical;
    if (name == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

Result<void> configureLogging(const config::ShimConfig& cfg, host::IHostConsole* console) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (console) {
            sinks.push_back(
                std::make_shared<HostConsoleSinkMt>(*console, cfg.logging.consoleWidth));
        }
        if (!cfg.logging.file.empty()) {
            std::error_code ec;
            if (cfg.logging.file.has_parent_path()) {
                std::filesystem::create_directories(cfg.logging.file.parent_path(), ec);
                if (ec) {
                    return Error{ErrorCode::InternalError,
                                 "Failed to create log directory: " + ec.message()};
                }
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logging.file.string(), max_size, max_files));
        }

        auto logger = std::make_shared<spdlog::logger>("scenelink", sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
        spdlog::set_default_logger(logger);
        spdlog::set_level(cfg.engine.debugLogging ? spdlog::level::debug
                                                  : parseLevel(cfg.logging.level));
        spdlog::flush_on(spdlog::level::warn);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Failed to setup logging: ") + e.what()};
    }
    return {};
}

} // namespace scenelink::logging
