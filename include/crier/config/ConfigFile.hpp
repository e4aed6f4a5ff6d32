#pragma once

#include "crier/Config.hpp"
#include "crier/Types.hpp"
#include "crier/log/StructuredLogger.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crier::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object
};

// Parsed configuration node. Only the shapes the config layout needs are
// represented; sequences are rejected by both readers.
struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> members;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value object();

    bool is_null() const { return type == ValueType::Null; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_string() const { return type == ValueType::String; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_boolean() const { return type == ValueType::Boolean; }

    // Null when key is absent or this is not an object.
    const Value* find(const std::string& key) const;
};

Value parse_json(const std::string& text);
Value parse_yaml(const std::string& text);

// JSON when the extension is .json or the first non-blank character is '{'.
Value load_document(const std::filesystem::path& path);

// $CRIER_CONFIG, then $XDG_CONFIG_HOME/crier/config.yaml, then ~/.config/crier/config.yaml.
std::optional<std::filesystem::path> default_config_path();

std::vector<std::string> preset_names(const Value& document);

// Flattens the "extends" chain of a preset; cycles and unknown parents are errors.
Value resolve_preset(const Value& document, const std::string& name);

struct LogSettings {
    std::optional<log::StructuredLogger::Format> format;
    std::optional<log::StructuredLogger::Level> level;
};

// Applies the "settings" block of a document on top of config.
void apply_settings(const Value& document, Config& config, LogSettings& logging);

// Partially specified operation parameters, from a preset or the command line.
struct OperationRequest {
    std::optional<Role> role;
    std::optional<std::string> direct_address;
    std::optional<std::string> broker;
    std::optional<std::uint16_t> port;
    std::optional<std::string> topic;
    std::optional<std::string> message;
    std::optional<std::string> auth;
};

OperationRequest request_from_preset(const Value& preset, const std::string& name);

// Fields set in overlay win.
OperationRequest merge(OperationRequest base, const OperationRequest& overlay);

// Structural checks only (mode, transport mix, message present); Orchestrator
// validation covers the transport details.
Operation build_operation(const OperationRequest& request);

}  // namespace crier::config
