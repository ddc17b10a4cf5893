#include "ATVConfig.hpp"
#include "ATVErrors.hpp"
#include "logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace AndroidTV {

std::string_view toString(PairingEncoding::Type type) {
    switch (type) {
    case PairingEncoding::Type::ALPHANUMERIC:
        return "alphanumeric";
    case PairingEncoding::Type::NUMERIC:
        return "numeric";
    case PairingEncoding::Type::HEXADECIMAL:
        return "hexadecimal";
    case PairingEncoding::Type::QRCODE:
        return "qrcode";
    }
    return "unknown";
}

std::optional<PairingEncoding::Type> encodingTypeFromString(std::string_view name) {
    if (name == "alphanumeric") return PairingEncoding::Type::ALPHANUMERIC;
    if (name == "numeric") return PairingEncoding::Type::NUMERIC;
    if (name == "hexadecimal") return PairingEncoding::Type::HEXADECIMAL;
    if (name == "qrcode") return PairingEncoding::Type::QRCODE;
    return std::nullopt;
}

namespace {

template <typename T>
void readValue(const nlohmann::json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it != j.end()) {
        out = it->template get<T>();
    }
}

void readMillis(const nlohmann::json &j, const char *key,
                std::chrono::milliseconds &out) {
    auto it = j.find(key);
    if (it != j.end()) {
        out = std::chrono::milliseconds(it->get<int64_t>());
    }
}

const nlohmann::json *section(const nlohmann::json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(fmt::format("\"{}\" must be an object", key));
    }
    return &*it;
}

} // namespace

ClientConfig parseConfig(std::string_view text) {
    ClientConfig config;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigError(fmt::format("malformed JSON: {}", e.what()));
    }
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    try {
        readValue(j, "client_name", config.clientName);
        readValue(j, "service_name", config.serviceName);
        std::string storage = config.storagePath.string();
        readValue(j, "storage_path", storage);
        config.storagePath = storage;
        readValue(j, "pairing_port", config.pairingPort);
        readValue(j, "control_port", config.controlPort);
        readValue(j, "max_frame_size", config.maxFrameSize);
        readValue(j, "strict_pinning", config.strictPinning);
        readValue(j, "log_level", config.logLevel);

        if (auto *t = section(j, "timeouts")) {
            readMillis(*t, "connect_ms", config.timeouts.connect);
            readMillis(*t, "tls_handshake_ms", config.timeouts.tlsHandshake);
            readMillis(*t, "pairing_step_ms", config.timeouts.pairingStep);
            readMillis(*t, "session_handshake_ms", config.timeouts.sessionHandshake);
            readMillis(*t, "keep_alive_ms", config.timeouts.keepAlive);
        }
        if (auto *r = section(j, "reconnect")) {
            readValue(*r, "enabled", config.reconnect.enabled);
            readMillis(*r, "initial_delay_ms", config.reconnect.initialDelay);
            readMillis(*r, "max_delay_ms", config.reconnect.maxDelay);
        }
        if (auto *d = section(j, "device")) {
            readValue(*d, "feature_mask", config.device.featureMask);
            readValue(*d, "package_name", config.device.packageName);
            readValue(*d, "app_version", config.device.appVersion);
        }
        if (auto *p = section(j, "pairing")) {
            auto it = p->find("encodings");
            if (it != p->end()) {
                if (!it->is_array() || it->empty()) {
                    throw ConfigError("\"pairing.encodings\" must be a non-empty array");
                }
                config.pairing.encodings.clear();
                for (const auto &e : *it) {
                    PairingEncoding encoding;
                    auto name = e.at("type").get<std::string>();
                    auto type = encodingTypeFromString(name);
                    if (!type) {
                        throw ConfigError(fmt::format("unknown pairing encoding \"{}\"", name));
                    }
                    encoding.type = *type;
                    readValue(e, "symbol_length", encoding.symbolLength);
                    config.pairing.encodings.push_back(encoding);
                }
            }
        }
    } catch (const nlohmann::json::exception &e) {
        throw ConfigError(fmt::format("invalid configuration value: {}", e.what()));
    }

    if (!Logger::levelFromString(config.logLevel)) {
        throw ConfigError(fmt::format("unknown log level \"{}\"", config.logLevel));
    }
    const std::pair<const char *, std::chrono::milliseconds> timeouts[] = {
        {"connect_ms", config.timeouts.connect},
        {"tls_handshake_ms", config.timeouts.tlsHandshake},
        {"pairing_step_ms", config.timeouts.pairingStep},
        {"session_handshake_ms", config.timeouts.sessionHandshake},
        {"keep_alive_ms", config.timeouts.keepAlive},
    };
    for (const auto &[key, value] : timeouts) {
        if (value.count() <= 0) {
            throw ConfigError(fmt::format("\"timeouts.{}\" must be positive, got {}", key, value.count()));
        }
    }
    if (config.maxFrameSize == 0) {
        throw ConfigError("\"max_frame_size\" must be positive");
    }
    if (config.reconnect.initialDelay.count() <= 0 ||
        config.reconnect.maxDelay < config.reconnect.initialDelay) {
        throw ConfigError("reconnect delays must be positive and max >= initial");
    }
    return config;
}

ClientConfig loadConfig(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("cannot open {}", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto config = parseConfig(buffer.str());
    LOG_INFO("Loaded configuration from {}", path.string());
    return config;
}

} // namespace AndroidTV
