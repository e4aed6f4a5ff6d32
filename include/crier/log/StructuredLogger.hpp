#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace crier::log {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    enum class Format {
        Text,
        Json
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    void set_format(Format format);

    static std::optional<Level> parse_level(std::string_view text);
    static std::optional<Format> parse_format(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();
    std::string render_json(Level level, std::string_view event, const FieldList& fields);
    std::string render_text(Level level, std::string_view event, const FieldList& fields);

    bool enabled_{true};
    Level min_level_{Level::Info};
    Format format_{Format::Text};
    mutable std::mutex mutex_;
};

// Shorthand used throughout the transports.
void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {});

}  // namespace crier::log
