#pragma once
// Value <-> bytes. Implementations throw SerializerError on malformed input.
#include <memory>
#include <string>
#include <string_view>
#include "../types.hpp"

namespace cachex {

class Serializer {
public:
    virtual ~Serializer() = default;

    [[nodiscard]] virtual std::string dumps(const Value& value) const = 0;
    [[nodiscard]] virtual Value loads(std::string_view data) const = 0;
    [[nodiscard]] virtual const char* name() const = 0;
};

class JsonSerializer : public Serializer {
public:
    [[nodiscard]] std::string dumps(const Value& value) const override;
    [[nodiscard]] Value loads(std::string_view data) const override;
    [[nodiscard]] const char* name() const override { return "json"; }
};

class MsgpackSerializer : public Serializer {
public:
    [[nodiscard]] std::string dumps(const Value& value) const override;
    [[nodiscard]] Value loads(std::string_view data) const override;
    [[nodiscard]] const char* name() const override { return "msgpack"; }
};

// "json" | "msgpack"; anything else is a ConfigError
std::unique_ptr<Serializer> make_serializer(const std::string& name);

} // namespace cachex
