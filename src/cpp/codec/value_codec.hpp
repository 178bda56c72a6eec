#pragma once
// Storage encoding for cached values.
//
// Integers (never booleans) are stored as decimal text so the engine can
// increment them in place. Everything else is serialized with the first
// configured serializer and compressed with the first configured compressor.
// Decoding tries an integer parse first, then every compressor in order
// (falling back to the raw bytes), then every serializer in order.
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "serializer.hpp"
#include "compressor.hpp"
#include "../config.hpp"

namespace cachex {

class ValueCodec {
public:
    explicit ValueCodec(const CodecConfig& cfg);

    [[nodiscard]] std::string encode(const Value& value) const;
    [[nodiscard]] Value decode(std::string_view data) const;

    // Strict decimal parse: optional sign, digits only
    [[nodiscard]] static std::optional<int64_t> parse_int(std::string_view text);

    [[nodiscard]] const std::vector<std::unique_ptr<Serializer>>& serializers() const { return serializers_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Compressor>>& compressors() const { return compressors_; }

private:
    [[nodiscard]] std::string decompress(std::string_view data) const;
    [[nodiscard]] Value deserialize(std::string_view data) const;

    std::vector<std::unique_ptr<Serializer>> serializers_;
    std::vector<std::unique_ptr<Compressor>> compressors_;
};

} // namespace cachex
