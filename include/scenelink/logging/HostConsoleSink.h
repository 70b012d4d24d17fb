#pragma once

#include <scenelink/host/host_interfaces.h>

#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace scenelink::logging {

// Word-wrap @p text to lines of at most @p width characters. Words longer than the width
// are split.
std::vector<std::string> wrapText(std::string_view text, std::size_t width);

/**
 * @brief spdlog sink that writes into the host application's script console.
 *
 * Messages are prefixed with "SceneLink: ". Info and warning output is wrapped to the
 * console width; errors are forwarded as a single line.
 */
template <typename Mutex> class HostConsoleSink : public spdlog::sinks::base_sink<Mutex> {
public:
    HostConsoleSink(host::IHostConsole& console, std::size_t width)
        : console_(console), width_(width ? width : 200) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string text = "SceneLink: ";
        text.append(msg.payload.data(), msg.payload.size());

        switch (msg.level) {
            case spdlog::level::err:
            case spdlog::level::critical:
                console_.displayError(text);
                break;
            case spdlog::level::warn:
                for (const auto& line : wrapText(text, width_))
                    console_.displayWarning(line);
                break;
            default:
                for (const auto& line : wrapText(text, width_))
                    console_.displayInfo(line);
                break;
        }
    }

    void flush_() override {}

private:
    host::IHostConsole& console_;
    std::size_t width_;
};

using HostConsoleSinkMt = HostConsoleSink<std::mutex>;
using HostConsoleSinkSt = HostConsoleSink<spdlog::details::null_mutex>;

} // namespace scenelink::logging
