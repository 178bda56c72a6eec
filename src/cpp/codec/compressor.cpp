#include "compressor.hpp"
#include <vector>
#include <zlib.h>
#include <lzma.h>

namespace cachex {

namespace {

// window_bits 15 = zlib header, 15 + 16 = gzip header
std::string deflate_buffer(std::string_view input, int level, int window_bits) {
    z_stream strm{};
    if (deflateInit2(&strm, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CompressorError("deflateInit2 failed");
    }

    // deflateBound accounts for the header of whichever wrapper was selected
    std::vector<Bytef> out(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw CompressorError("deflate did not finish (" + std::to_string(ret) + ")");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), out.size() - strm.avail_out);
}

std::string inflate_buffer(std::string_view input, int window_bits, const char* what) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) {
        throw CompressorError(std::string(what) + ": inflateInit2 failed");
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = sizeof(chunk);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw CompressorError(std::string(what) + ": invalid stream (" +
                                  (strm.msg ? strm.msg : std::to_string(ret)) + ")");
        }
        out.append(chunk, sizeof(chunk) - strm.avail_out);
    } while (ret != Z_STREAM_END && (strm.avail_in > 0 || strm.avail_out == 0));

    inflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw CompressorError(std::string(what) + ": truncated stream");
    }
    return out;
}

} // namespace

std::string ZlibCompressor::do_compress(std::string_view data) const {
    return deflate_buffer(data, level_, 15);
}

std::string ZlibCompressor::decompress(std::string_view data) const {
    return inflate_buffer(data, 15, "zlib");
}

std::string GzipCompressor::do_compress(std::string_view data) const {
    return deflate_buffer(data, level_, 15 + 16);
}

std::string GzipCompressor::decompress(std::string_view data) const {
    return inflate_buffer(data, 15 + 16, "gzip");
}

std::string LzmaCompressor::do_compress(std::string_view data) const {
    std::vector<uint8_t> out(lzma_stream_buffer_bound(data.size()));
    size_t out_pos = 0;
    lzma_ret ret = lzma_easy_buffer_encode(
        preset_, LZMA_CHECK_CRC64, nullptr,
        reinterpret_cast<const uint8_t*>(data.data()), data.size(),
        out.data(), &out_pos, out.size());
    if (ret != LZMA_OK) {
        throw CompressorError("lzma encode failed (" + std::to_string(ret) + ")");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), out_pos);
}

std::string LzmaCompressor::decompress(std::string_view data) const {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_auto_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        throw CompressorError("lzma: decoder init failed");
    }

    strm.next_in = reinterpret_cast<const uint8_t*>(data.data());
    strm.avail_in = data.size();

    std::string out;
    uint8_t chunk[16384];
    lzma_ret ret = LZMA_OK;
    while (ret == LZMA_OK) {
        strm.next_out = chunk;
        strm.avail_out = sizeof(chunk);
        ret = lzma_code(&strm, LZMA_FINISH);
        out.append(reinterpret_cast<const char*>(chunk), sizeof(chunk) - strm.avail_out);
    }
    lzma_end(&strm);

    if (ret != LZMA_STREAM_END) {
        throw CompressorError("lzma: invalid stream (" + std::to_string(ret) + ")");
    }
    return out;
}

std::unique_ptr<Compressor> make_compressor(const std::string& name, const CodecConfig& cfg) {
    if (name == "zlib") return std::make_unique<ZlibCompressor>(cfg.min_length, cfg.zlib_level);
    if (name == "gzip") return std::make_unique<GzipCompressor>(cfg.min_length, cfg.zlib_level);
    if (name == "lzma") return std::make_unique<LzmaCompressor>(cfg.min_length, cfg.lzma_preset);
    if (name == "identity") return std::make_unique<IdentityCompressor>(cfg.min_length);
    throw ConfigError("unknown compressor '" + name + "' (valid: zlib, gzip, lzma, identity)");
}

} // namespace cachex
