#include <atomic>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <knotview/config.hpp>
#include <knotview/logger.hpp>
#include <string_view>

namespace knotview
{

namespace
{

std::atomic<uint64_t> g_output_sequence{0};

const char* env_value(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

template <typename T>
void read_positive(const char* name, T& out)
{
    const char* v = env_value(name);
    if (!v)
        return;

    std::string_view text(v);
    long long        parsed = 0;
    auto [ptr, ec]          = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || parsed <= 0)
    {
        KNOTVIEW_LOG_WARN("config", "Ignoring {}={}: expected a positive integer", name, v);
        return;
    }
    out = static_cast<T>(parsed);
}

}   // anonymous namespace

RenderConfig RenderConfig::from_env()
{
    RenderConfig config;

    if (const char* dir = env_value("KNOTVIEW_OUTPUT_DIR"))
        config.output_dir = dir;
    if (const char* prefix = env_value("KNOTVIEW_OUTPUT_PREFIX"))
        config.output_prefix = prefix;

    read_positive("KNOTVIEW_WIDTH", config.width);
    read_positive("KNOTVIEW_HEIGHT", config.height);
    read_positive("KNOTVIEW_TUBE_POINTS", config.tube_points);
    if (config.tube_points < 3)
    {
        KNOTVIEW_LOG_WARN("config", "tube_points {} too small, using 3", config.tube_points);
        config.tube_points = 3;
    }

    if (const char* level = env_value("KNOTVIEW_LOG_LEVEL"))
    {
        if (auto parsed = Logger::level_from_string(level))
            config.log_level = *parsed;
        else
            KNOTVIEW_LOG_WARN("config", "Ignoring unknown KNOTVIEW_LOG_LEVEL={}", level);
    }

    if (const char* file = env_value("KNOTVIEW_LOG_FILE"))
        config.log_file = file;

    return config;
}

std::string RenderConfig::next_output_path(const std::string& extension) const
{
    uint64_t n = ++g_output_sequence;
    std::filesystem::path path(output_dir);
    path /= output_prefix + "-" + std::to_string(n) + "." + extension;
    return path.string();
}

void init_logging(const RenderConfig& config)
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(config.log_level);
    logger.add_sink(sinks::console_sink());

    if (!config.log_file.empty())
    {
        logger.add_sink(sinks::file_sink(config.log_file));
        KNOTVIEW_LOG_INFO("config", "Log file: {}", config.log_file);
    }
}

}   // namespace knotview
