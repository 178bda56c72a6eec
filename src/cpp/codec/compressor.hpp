#pragma once
// Byte-level compressors. compress() leaves payloads of min_length bytes or
// fewer untouched; decompress() throws CompressorError on foreign input.
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "../config.hpp"

namespace cachex {

class Compressor {
public:
    explicit Compressor(size_t min_length) : min_length_(min_length) {}
    virtual ~Compressor() = default;

    [[nodiscard]] std::string compress(std::string_view data) const {
        if (data.size() > min_length_) return do_compress(data);
        return std::string(data);
    }

    [[nodiscard]] virtual std::string decompress(std::string_view data) const = 0;
    [[nodiscard]] virtual const char* name() const = 0;

    [[nodiscard]] size_t min_length() const { return min_length_; }

protected:
    [[nodiscard]] virtual std::string do_compress(std::string_view data) const = 0;

private:
    size_t min_length_;
};

class IdentityCompressor : public Compressor {
public:
    explicit IdentityCompressor(size_t min_length) : Compressor(min_length) {}

    [[nodiscard]] std::string decompress(std::string_view data) const override { return std::string(data); }
    [[nodiscard]] const char* name() const override { return "identity"; }

protected:
    [[nodiscard]] std::string do_compress(std::string_view data) const override { return std::string(data); }
};

// zlib container (RFC 1950)
class ZlibCompressor : public Compressor {
public:
    ZlibCompressor(size_t min_length, int level) : Compressor(min_length), level_(level) {}

    [[nodiscard]] std::string decompress(std::string_view data) const override;
    [[nodiscard]] const char* name() const override { return "zlib"; }

protected:
    [[nodiscard]] std::string do_compress(std::string_view data) const override;

private:
    int level_;
};

// gzip container (RFC 1952), same deflate stream as zlib
class GzipCompressor : public Compressor {
public:
    GzipCompressor(size_t min_length, int level) : Compressor(min_length), level_(level) {}

    [[nodiscard]] std::string decompress(std::string_view data) const override;
    [[nodiscard]] const char* name() const override { return "gzip"; }

protected:
    [[nodiscard]] std::string do_compress(std::string_view data) const override;

private:
    int level_;
};

// .xz container via liblzma
class LzmaCompressor : public Compressor {
public:
    LzmaCompressor(size_t min_length, uint32_t preset) : Compressor(min_length), preset_(preset) {}

    [[nodiscard]] std::string decompress(std::string_view data) const override;
    [[nodiscard]] const char* name() const override { return "lzma"; }

protected:
    [[nodiscard]] std::string do_compress(std::string_view data) const override;

private:
    uint32_t preset_;
};

// "zlib" | "gzip" | "lzma" | "identity"
std::unique_ptr<Compressor> make_compressor(const std::string& name, const CodecConfig& cfg);

} // namespace cachex
