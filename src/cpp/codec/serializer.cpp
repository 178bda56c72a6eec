#include "serializer.hpp"
#include <cstdint>
#include <vector>

namespace cachex {

std::string JsonSerializer::dumps(const Value& value) const {
    try {
        return value.dump();
    } catch (const nlohmann::json::exception& e) {
        throw SerializerError(std::string("json encode failed: ") + e.what());
    }
}

Value JsonSerializer::loads(std::string_view data) const {
    try {
        return nlohmann::json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::exception& e) {
        throw SerializerError(std::string("json decode failed: ") + e.what());
    }
}

std::string MsgpackSerializer::dumps(const Value& value) const {
    try {
        std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(value);
        return std::string(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw SerializerError(std::string("msgpack encode failed: ") + e.what());
    }
}

Value MsgpackSerializer::loads(std::string_view data) const {
    try {
        return nlohmann::json::from_msgpack(data.begin(), data.end());
    } catch (const nlohmann::json::exception& e) {
        throw SerializerError(std::string("msgpack decode failed: ") + e.what());
    }
}

std::unique_ptr<Serializer> make_serializer(const std::string& name) {
    if (name == "json") return std::make_unique<JsonSerializer>();
    if (name == "msgpack") return std::make_unique<MsgpackSerializer>();
    throw ConfigError("unknown serializer '" + name + "' (valid: json, msgpack)");
}

} // namespace cachex
