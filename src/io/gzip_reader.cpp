#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace pkgrepo {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                // Source exhausted before Z_STREAM_END: truncated input.
                break;
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }

        if (ret == Z_BUF_ERROR && strm_.avail_in == 0) {
            break;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

Result GzipDecompress(std::span<const std::uint8_t> in, Bytes& out) {
    try {
        GzipReader reader(std::make_unique<SpanReader>(in));
        auto r = ReadAll(reader, out);
        if (!r.is_ok())
            return Result::Fail(ErrorCode::MalformedPackage, "corrupt gzip stream");
        if (!reader.Finished())
            return Result::Fail(ErrorCode::MalformedPackage, "truncated gzip stream");
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::StorageError, std::string("gzip init failed: ") + e.what());
    }
    return Result::Ok();
}

Result GzipCompress(std::span<const std::uint8_t> in, Bytes& out) {
    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    // gzip wrapper with a zero mtime so equal input gives equal output
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result::Fail(ErrorCode::MetadataBuildFailed, "Failed to initialize zlib deflate");
    }

    out.resize(deflateBound(&strm, static_cast<uLong>(in.size())) + 32);
    strm.next_in = const_cast<Bytef*>(in.data());
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&strm, Z_FINISH);
    const size_t produced = out.size() - strm.avail_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        out.clear();
        return Result::Fail(ErrorCode::MetadataBuildFailed, "zlib deflate failed");
    }
    out.resize(produced);
    return Result::Ok();
}

} // namespace pkgrepo
