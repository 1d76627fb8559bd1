#include <shapediff-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace shapediff_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    const auto name = std::string{logger_name};
    if (auto existing = spdlog::get(name)) return existing;

    static std::mutex creation_mutex;
    auto lock = std::scoped_lock{creation_mutex};
    if (auto existing = spdlog::get(name)) return existing;

    auto created = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);
    return created;
}

}  // namespace shapediff_cpp
