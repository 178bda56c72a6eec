#include "value_codec.hpp"
#include <charconv>
#include "../utils/logger.hpp"

namespace cachex {

ValueCodec::ValueCodec(const CodecConfig& cfg) {
    if (cfg.serializers.empty()) throw ConfigError("at least one serializer is required");
    for (const auto& name : cfg.serializers) serializers_.push_back(make_serializer(name));
    for (const auto& name : cfg.compressors) compressors_.push_back(make_compressor(name, cfg));

    LOG_DBG("[codec] encode with serializer=%s compressor=%s, decode tries %zu/%zu",
        serializers_.front()->name(),
        compressors_.empty() ? "none" : compressors_.front()->name(),
        serializers_.size(), compressors_.size());
}

std::optional<int64_t> ValueCodec::parse_int(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;

    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return v;
}

std::string ValueCodec::encode(const Value& value) const {
    if (value.is_number_integer()) {
        // unsigned values above INT64_MAX keep their own decimal form
        if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
        return std::to_string(value.get<int64_t>());
    }

    std::string data = serializers_.front()->dumps(value);
    if (!compressors_.empty()) return compressors_.front()->compress(data);
    return data;
}

Value ValueCodec::decode(std::string_view data) const {
    if (auto n = parse_int(data)) return Value(*n);
    return deserialize(decompress(data));
}

std::string ValueCodec::decompress(std::string_view data) const {
    for (const auto& c : compressors_) {
        try {
            return c->decompress(data);
        } catch (const CompressorError& e) {
            LOG_DBG("[codec] %s: %s", c->name(), e.what());
        }
    }
    return std::string(data);
}

Value ValueCodec::deserialize(std::string_view data) const {
    std::optional<SerializerError> last_error;
    for (const auto& s : serializers_) {
        try {
            return s->loads(data);
        } catch (const SerializerError& e) {
            last_error = e;
        }
    }
    LOG_ERR("[codec] no serializer could decode a %zu-byte payload", data.size());
    throw *last_error;
}

} // namespace cachex
