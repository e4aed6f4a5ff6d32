#include "crier/config/ConfigFile.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace crier::config {

namespace {

std::string strip(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

ConfigError parse_error(std::string message, std::size_t line = 0) {
    if (line != 0) {
        message += " (line " + std::to_string(line) + ")";
    }
    return ConfigError("E_CONFIG_PARSE", std::move(message));
}

void append_utf8(std::string& out, unsigned int code_point) {
    if (code_point <= 0x7F) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document() {
        Value value = read_value();
        skip_blank();
        if (pos_ < text_.size()) {
            throw parse_error("Trailing content after JSON document");
        }
        return value;
    }

    // Reads one double-quoted string starting at the current position.
    std::string read_string() {
        if (next() != '"') {
            throw parse_error("Expected '\"' to open a string");
        }
        std::string out;
        while (pos_ < text_.size()) {
            const char ch = next();
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    throw parse_error("Unescaped control character in string");
                }
                out.push_back(ch);
                continue;
            }
            switch (const char esc = next()) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'u':
                    append_utf8(out, read_hex4());
                    break;
                default:
                    throw parse_error("Unknown escape sequence in string");
            }
        }
        throw parse_error("Unterminated string");
    }

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

private:
    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }
    char next() { return pos_ < text_.size() ? text_[pos_++] : '\0'; }

    void skip_blank() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume_literal(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) != literal) {
            return false;
        }
        pos_ += literal.size();
        return true;
    }

    unsigned int read_hex4() {
        if (pos_ + 4 > text_.size()) {
            throw parse_error("Truncated \\u escape");
        }
        unsigned int code_point = 0;
        const auto* begin = text_.data() + pos_;
        const auto [ptr, ec] = std::from_chars(begin, begin + 4, code_point, 16);
        if (ec != std::errc{} || ptr != begin + 4) {
            throw parse_error("Invalid \\u escape");
        }
        pos_ += 4;
        return code_point;
    }

    Value read_value() {
        skip_blank();
        const char ch = peek();
        if (ch == '{') {
            return read_object();
        }
        if (ch == '"') {
            return Value(read_string());
        }
        if (ch == '[') {
            throw parse_error("Sequences are not supported in crier configuration");
        }
        if (consume_literal("true")) {
            return Value(true);
        }
        if (consume_literal("false")) {
            return Value(false);
        }
        if (consume_literal("null")) {
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return read_integer();
        }
        throw parse_error(at_end() ? "Unexpected end of JSON" : "Unexpected character in JSON value");
    }

    Value read_integer() {
        std::int64_t value{};
        const auto* begin = text_.data() + pos_;
        const auto [ptr, ec] = std::from_chars(begin, text_.data() + text_.size(), value);
        if (ec != std::errc{}) {
            throw parse_error("Invalid integer in JSON");
        }
        pos_ += static_cast<std::size_t>(ptr - begin);
        if (peek() == '.' || peek() == 'e' || peek() == 'E') {
            throw parse_error("Only integer numbers are supported in crier configuration");
        }
        return Value(value);
    }

    Value read_object() {
        ++pos_;
        Value object = Value::object();
        skip_blank();
        if (peek() == '}') {
            ++pos_;
            return object;
        }
        while (true) {
            skip_blank();
            std::string key = read_string();
            skip_blank();
            if (next() != ':') {
                throw parse_error("Expected ':' after object key '" + key + "'");
            }
            object.members[std::move(key)] = read_value();
            skip_blank();
            const char separator = next();
            if (separator == '}') {
                return object;
            }
            if (separator != ',') {
                throw parse_error("Expected ',' or '}' in JSON object");
            }
        }
    }

    std::string_view text_;
    std::size_t pos_{0};
};

bool opens_token(std::string_view line, std::size_t index) {
    return index == 0 || line[index - 1] == ' ' || line[index - 1] == '\t' || line[index - 1] == ':';
}

// A '#' starts a comment at the beginning of a line or after whitespace,
// never inside a quoted scalar.
std::string_view without_comment(std::string_view line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
            continue;
        }
        if ((ch == '"' || ch == '\'') && opens_token(line, i)) {
            quote = ch;
        } else if (ch == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

Value yaml_scalar(const std::string& text, std::size_t line) {
    if (text.empty() || text == "~" || text == "null") {
        return Value();
    }
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        JsonReader reader(text);
        auto value = reader.read_string();
        if (!reader.at_end()) {
            throw parse_error("Unexpected text after quoted string", line);
        }
        return Value(std::move(value));
    }
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
        return Value(text.substr(1, text.size() - 2));
    }
    if (text == "true" || text == "yes") {
        return Value(true);
    }
    if (text == "false" || text == "no") {
        return Value(false);
    }
    std::int64_t number{};
    const auto* end = text.data() + text.size();
    if (const auto [ptr, ec] = std::from_chars(text.data(), end, number); ec == std::errc{} && ptr == end) {
        return Value(number);
    }
    return Value(text);
}

std::string join_names(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "<none>";
    }
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

const Value& presets_of(const Value& document) {
    static const Value empty = Value::object();
    const auto* presets = document.find("presets");
    if (!presets) {
        return empty;
    }
    if (!presets->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'presets' must be a mapping");
    }
    return *presets;
}

Value flatten(const Value& presets, const std::string& name, std::set<std::string>& chain) {
    const auto* preset = presets.find(name);
    if (!preset) {
        std::vector<std::string> names;
        for (const auto& [key, unused] : presets.members) {
            names.push_back(key);
        }
        throw ConfigError("E_CONFIG_PRESET", "Unknown preset '" + name + "'", "Available presets: " + join_names(names));
    }
    if (!preset->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Preset '" + name + "' must be a mapping");
    }
    if (!chain.insert(name).second) {
        throw ConfigError("E_CONFIG_PRESET", "Preset inheritance cycle through '" + name + "'");
    }

    Value resolved = Value::object();
    if (const auto* parent = preset->find("extends")) {
        if (!parent->is_string()) {
            throw ConfigError("E_CONFIG_PRESET", "'extends' in preset '" + name + "' must name another preset");
        }
        resolved = flatten(presets, parent->string_value, chain);
    }
    for (const auto& [key, value] : preset->members) {
        if (key == "extends") {
            continue;
        }
        auto& slot = resolved.members[key];
        if (value.is_object() && slot.is_object()) {
            for (const auto& [inner_key, inner_value] : value.members) {
                slot.members[inner_key] = inner_value;
            }
        } else {
            slot = value;
        }
    }
    chain.erase(name);
    return resolved;
}

std::string where(std::string_view section, std::string_view key) {
    return std::string(section) + "." + std::string(key);
}

std::string text_of(const Value& value, std::string_view section, std::string_view key) {
    if (value.is_string()) {
        return value.string_value;
    }
    if (value.is_integer()) {
        return std::to_string(value.integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected text at " + where(section, key));
}

std::int64_t integer_of(const Value& value, std::string_view section, std::string_view key,
                        std::int64_t min, std::int64_t max) {
    if (!value.is_integer()) {
        throw ConfigError("E_CONFIG_TYPE", "Expected an integer at " + where(section, key));
    }
    if (value.integer_value < min || value.integer_value > max) {
        throw ConfigError("E_CONFIG_RANGE",
                          where(section, key) + " must be between " + std::to_string(min) + " and " +
                              std::to_string(max));
    }
    return value.integer_value;
}

void unknown_key(std::string_view section, std::string_view key, std::string_view accepted) {
    throw ConfigError("E_CONFIG_UNKNOWN_KEY",
                      "Unknown key " + where(section, key),
                      "Accepted keys: " + std::string(accepted));
}

}  // namespace

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

Value Value::object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

const Value* Value::find(const std::string& key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = members.find(key);
    return it == members.end() ? nullptr : &it->second;
}

Value parse_json(const std::string& text) {
    return JsonReader(text).read_document();
}

Value parse_yaml(const std::string& text) {
    struct Frame {
        std::size_t indent;
        Value* node;
    };

    Value root = Value::object();
    std::vector<Frame> frames{{0, &root}};
    // Set by a "key:" line with no value; the next deeper line opens its mapping.
    Value* open_parent = nullptr;

    std::istringstream input(text);
    std::string raw;
    std::size_t line_number = 0;
    while (std::getline(input, raw)) {
        ++line_number;
        const std::string_view uncommented = without_comment(raw);
        const auto content_start = uncommented.find_first_not_of(' ');
        if (content_start == std::string_view::npos || strip(uncommented).empty()) {
            continue;
        }
        if (uncommented[content_start] == '\t') {
            throw parse_error("Tabs are not allowed in indentation", line_number);
        }
        const std::size_t indent = content_start;
        if (indent % 2 != 0) {
            throw parse_error("Indentation must use multiples of two spaces", line_number);
        }
        const std::string content = strip(uncommented.substr(indent));
        if (content.front() == '-') {
            throw parse_error("Sequences are not supported in crier configuration", line_number);
        }

        if (open_parent) {
            if (indent > frames.back().indent) {
                *open_parent = Value::object();
                frames.push_back({indent, open_parent});
            }
            open_parent = nullptr;
        }
        while (frames.size() > 1 && indent < frames.back().indent) {
            frames.pop_back();
        }
        if (indent != frames.back().indent) {
            throw parse_error("Unexpected indentation", line_number);
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw parse_error("Expected 'key: value'", line_number);
        }
        std::string key = strip(std::string_view(content).substr(0, colon));
        if (key.empty()) {
            throw parse_error("Empty mapping key", line_number);
        }
        if (key.size() >= 2 && (key.front() == '"' || key.front() == '\'') && key.back() == key.front()) {
            key = key.substr(1, key.size() - 2);
        }
        const std::string value_text = strip(std::string_view(content).substr(colon + 1));

        auto& slot = frames.back().node->members[key];
        if (value_text.empty()) {
            slot = Value();
            open_parent = &slot;
        } else {
            slot = yaml_scalar(value_text, line_number);
        }
    }
    return root;
}

Value load_document(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + path.string(),
                          "Check the --config path or the CRIER_CONFIG variable");
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    const std::string contents = buffer.str();

    const auto first = contents.find_first_not_of(" \t\r\n");
    const bool json = path.extension() == ".json" || (first != std::string::npos && contents[first] == '{');
    Value document = json ? parse_json(contents) : parse_yaml(contents);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a mapping");
    }
    for (const auto& [key, unused] : document.members) {
        if (key != "settings" && key != "presets") {
            unknown_key("<root>", key, "settings, presets");
        }
    }
    return document;
}

std::optional<std::filesystem::path> default_config_path() {
    if (const char* explicit_path = std::getenv("CRIER_CONFIG"); explicit_path && *explicit_path) {
        return std::filesystem::path(explicit_path);
    }

    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return std::nullopt;
    }

    auto candidate = base / "crier" / "config.yaml";
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }
    return candidate;
}

std::vector<std::string> preset_names(const Value& document) {
    std::vector<std::string> names;
    for (const auto& [name, unused] : presets_of(document).members) {
        names.push_back(name);
    }
    return names;
}

Value resolve_preset(const Value& document, const std::string& name) {
    std::set<std::string> chain;
    return flatten(presets_of(document), name, chain);
}

void apply_settings(const Value& document, Config& config, LogSettings& logging) {
    const auto* settings = document.find("settings");
    if (!settings || settings->is_null()) {
        return;
    }
    if (!settings->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'settings' must be a mapping");
    }

    constexpr std::string_view section = "settings";
    for (const auto& [key, value] : settings->members) {
        if (key == "relay_timeout_ms") {
            config.relay_confirm_timeout = std::chrono::milliseconds(integer_of(value, section, key, 1, 3'600'000));
        } else if (key == "keep_alive_seconds") {
            config.relay_keep_alive = std::chrono::seconds(integer_of(value, section, key, 0, 65535));
        } else if (key == "reconnect_delay_ms") {
            config.relay_reconnect_delay = std::chrono::milliseconds(integer_of(value, section, key, 0, 3'600'000));
        } else if (key == "client_id_prefix") {
            auto prefix = text_of(value, section, key);
            if (prefix.empty()) {
                throw ConfigError("E_CONFIG_RANGE", "settings.client_id_prefix must not be empty");
            }
            config.client_id_prefix = std::move(prefix);
        } else if (key == "shell") {
            config.shell = text_of(value, section, key);
        } else if (key == "log_format") {
            const auto format = log::StructuredLogger::parse_format(text_of(value, section, key));
            if (!format) {
                throw ConfigError("E_CONFIG_RANGE", "settings.log_format must be 'text' or 'json'");
            }
            logging.format = format;
        } else if (key == "log_level") {
            const auto level = log::StructuredLogger::parse_level(text_of(value, section, key));
            if (!level) {
                throw ConfigError("E_CONFIG_RANGE", "settings.log_level must be debug, info, warning or error");
            }
            logging.level = level;
        } else {
            unknown_key(section, key,
                        "relay_timeout_ms, keep_alive_seconds, reconnect_delay_ms, client_id_prefix, shell, "
                        "log_format, log_level");
        }
    }
}

OperationRequest request_from_preset(const Value& preset, const std::string& name) {
    OperationRequest request{};
    const std::string section = "presets." + name;
    std::optional<std::string> listen_address;
    std::optional<std::string> send_address;

    for (const auto& [key, value] : preset.members) {
        if (key == "mode") {
            const auto mode = text_of(value, section, key);
            if (mode == "listen") {
                request.role = Role::Listener;
            } else if (mode == "send") {
                request.role = Role::Sender;
            } else {
                throw ConfigError("E_CONFIG_RANGE", section + ".mode must be 'listen' or 'send'");
            }
        } else if (key == "listen") {
            listen_address = text_of(value, section, key);
        } else if (key == "send") {
            send_address = text_of(value, section, key);
        } else if (key == "message") {
            request.message = text_of(value, section, key);
        } else if (key == "auth") {
            request.auth = text_of(value, section, key);
        } else if (key == "mqtt") {
            if (!value.is_object()) {
                throw ConfigError("E_CONFIG_STRUCTURE", section + ".mqtt must be a mapping");
            }
            const std::string mqtt_section = section + ".mqtt";
            for (const auto& [mqtt_key, mqtt_value] : value.members) {
                if (mqtt_key == "broker") {
                    request.broker = text_of(mqtt_value, mqtt_section, mqtt_key);
                } else if (mqtt_key == "port") {
                    request.port = static_cast<std::uint16_t>(integer_of(mqtt_value, mqtt_section, mqtt_key, 1, 65535));
                } else if (mqtt_key == "topic") {
                    request.topic = text_of(mqtt_value, mqtt_section, mqtt_key);
                } else {
                    unknown_key(mqtt_section, mqtt_key, "broker, port, topic");
                }
            }
        } else {
            unknown_key(section, key, "extends, mode, listen, send, mqtt, message, auth");
        }
    }

    if (!request.role) {
        if (listen_address && send_address) {
            throw ConfigError("E_CONFIG_PRESET",
                              "Preset '" + name + "' sets both listen and send",
                              "Add 'mode: listen' or 'mode: send' to choose one");
        }
        if (listen_address) {
            request.role = Role::Listener;
        } else if (send_address) {
            request.role = Role::Sender;
        }
    }
    if (request.role == Role::Listener) {
        request.direct_address = listen_address;
    } else if (request.role == Role::Sender) {
        request.direct_address = send_address;
    }
    return request;
}

OperationRequest merge(OperationRequest base, const OperationRequest& overlay) {
    auto take = [](auto& target, const auto& source) {
        if (source) {
            target = source;
        }
    };
    take(base.role, overlay.role);
    take(base.port, overlay.port);
    take(base.topic, overlay.topic);
    take(base.message, overlay.message);
    take(base.auth, overlay.auth);
    // Choosing one transport on top of a preset replaces the other.
    if (overlay.direct_address) {
        base.direct_address = overlay.direct_address;
        base.broker.reset();
    }
    if (overlay.broker) {
        base.broker = overlay.broker;
        base.direct_address.reset();
    }
    return base;
}

Operation build_operation(const OperationRequest& request) {
    if (!request.role) {
        throw ConfigError("E_MODE_REQUIRED", "Choose a mode", "Pass --listen or --send (or a preset with 'mode')");
    }
    if (request.direct_address && request.broker) {
        throw ConfigError("E_TRANSPORT_CONFLICT",
                          "Both a direct address and a relay broker were given",
                          "Use either an address or --mqtt, not both");
    }
    if (!request.broker && (request.topic || request.port)) {
        throw ConfigError("E_TRANSPORT_CONFLICT",
                          "--topic and --port only apply to the relay transport",
                          "Add --mqtt HOST[:PORT]");
    }
    // An empty message is a valid one; only a missing one is an error.
    if (!request.message) {
        throw ConfigError("E_MESSAGE_REQUIRED",
                          *request.role == Role::Listener ? "Listener requires a command template"
                                                          : "Sender requires a message",
                          "Pass -m TEXT (or a preset with 'message')");
    }

    Operation operation{};
    operation.role = *request.role;
    operation.payload_or_template = *request.message;
    operation.auth = request.auth;
    if (request.broker) {
        RelayTarget target{};
        target.broker = *request.broker;
        target.port = request.port.value_or(target.port);
        target.topic = request.topic.value_or(std::string{});
        operation.transport = std::move(target);
    } else if (request.direct_address) {
        operation.transport = DirectTarget{*request.direct_address};
    }
    return operation;
}

}  // namespace crier::config
