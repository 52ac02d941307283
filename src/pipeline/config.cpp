#include "sconv/pipeline/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace sconv::pipeline {

using json = nlohmann::json;

namespace {

const std::vector<std::string> kFragmentedMp4Output = {
    "-f", "mp4", "-movflags", "frag_keyframe+empty_moov+default_base_moof", "pipe:1"
};

std::vector<std::string> with_output(std::vector<std::string> args) {
    args.insert(args.end(), kFragmentedMp4Output.begin(), kFragmentedMp4Output.end());
    return args;
}

template<typename T>
Result<void> read_unsigned(const json& doc, const char* key, T& out) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err<void>(std::string("Config key '") + key + "' must be a non-negative integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        return Err<void>(std::string("Config key '") + key + "' is out of range");
    }
    out = static_cast<T>(value);
    return Ok();
}

Result<void> read_millis(const json& doc, const char* key, std::chrono::milliseconds& out) {
    std::uint32_t millis = static_cast<std::uint32_t>(out.count());
    if (auto res = read_unsigned(doc, key, millis); res.is_error()) {
        return res;
    }
    out = std::chrono::milliseconds(millis);
    return Ok();
}

Result<void> read_bool(const json& doc, const char* key, bool& out) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err<void>(std::string("Config key '") + key + "' must be a boolean");
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_args(const json& doc, const char* key, std::vector<std::string>& out) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_array()) {
        return Err<void>(std::string("Config key '") + key + "' must be an array of strings");
    }
    std::vector<std::string> args;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return Err<void>(std::string("Config key '") + key + "' must be an array of strings");
        }
        args.push_back(item.get<std::string>());
    }
    out = std::move(args);
    return Ok();
}

} // namespace

std::vector<std::string> default_stream_copy_args() {
    return with_output({
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-i", "pipe:0",
        "-c:v", "copy", "-c:a", "copy"
    });
}

std::vector<std::string> default_full_reencode_args() {
    return with_output({
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-i", "pipe:0",
        "-c:v", "libx264", "-preset", "fast", "-crf", "23",
        "-c:a", "aac"
    });
}

Result<void> PipelineConfig::validate() const {
    if (chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize) {
        return Err<void>("chunk_size must be between " + std::to_string(kMinChunkSize) +
                         " and " + std::to_string(kMaxChunkSize) + " bytes");
    }
    if (source_read_retries > kMaxRetries || destination_write_retries > kMaxRetries) {
        return Err<void>("retry counts must not exceed " + std::to_string(kMaxRetries));
    }
    if (retry_backoff.count() < 0) {
        return Err<void>(std::string("retry_backoff must not be negative"));
    }
    if (size_warning_threshold == 0) {
        return Err<void>(std::string("size_warning_threshold must be > 0"));
    }
    if (heartbeat_interval.count() <= 0) {
        return Err<void>(std::string("heartbeat_interval must be > 0"));
    }
    if (diagnostic_limit == 0) {
        return Err<void>(std::string("diagnostic_limit must be > 0"));
    }
    if (http_timeout.count() <= 0) {
        return Err<void>(std::string("http_timeout must be > 0"));
    }
    if (stream_copy_args.empty() || stream_copy_args.front().empty()) {
        return Err<void>(std::string("stream_copy_args must name a converter executable"));
    }
    if (full_reencode_args.empty() || full_reencode_args.front().empty()) {
        return Err<void>(std::string("full_reencode_args must name a converter executable"));
    }
    return Ok();
}

const std::vector<std::string>& PipelineConfig::args_for(ConversionStrategy strategy) const {
    return strategy == ConversionStrategy::StreamCopy ? stream_copy_args : full_reencode_args;
}

Result<PipelineConfig> parse_config(const std::string& text) {
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<PipelineConfig>(std::string("Config is not valid JSON"));
    }
    if (!doc.is_object()) {
        return Err<PipelineConfig>(std::string("Config must be a JSON object"));
    }

    static const std::set<std::string> known_keys = {
        "chunk_size", "source_read_retries", "destination_write_retries", "retry_backoff_ms",
        "size_warning_threshold", "heartbeat_interval_ms", "diagnostic_limit",
        "stream_copy_args", "full_reencode_args", "http_timeout_ms", "overwrite_existing"
    };
    for (const auto& item : doc.items()) {
        if (known_keys.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown config key '{}'", item.key());
        }
    }

    PipelineConfig config;
    const Result<void> steps[] = {
        read_unsigned(doc, "chunk_size", config.chunk_size),
        read_unsigned(doc, "source_read_retries", config.source_read_retries),
        read_unsigned(doc, "destination_write_retries", config.destination_write_retries),
        read_millis(doc, "retry_backoff_ms", config.retry_backoff),
        read_unsigned(doc, "size_warning_threshold", config.size_warning_threshold),
        read_millis(doc, "heartbeat_interval_ms", config.heartbeat_interval),
        read_unsigned(doc, "diagnostic_limit", config.diagnostic_limit),
        read_args(doc, "stream_copy_args", config.stream_copy_args),
        read_args(doc, "full_reencode_args", config.full_reencode_args),
        read_millis(doc, "http_timeout_ms", config.http_timeout),
        read_bool(doc, "overwrite_existing", config.overwrite_existing),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return Err<PipelineConfig>(step.error());
        }
    }

    if (auto res = config.validate(); res.is_error()) {
        return Err<PipelineConfig>(res.error());
    }
    return Ok(std::move(config));
}

Result<PipelineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<PipelineConfig>(std::string("Failed to open config file: ") + path.string());
    }
    std::ostringstream text;
    text << input.rdbuf();

    auto config = parse_config(text.str());
    if (config.is_error()) {
        return Err<PipelineConfig>(path.string() + ": " + config.error());
    }
    return config;
}

} // namespace sconv::pipeline
