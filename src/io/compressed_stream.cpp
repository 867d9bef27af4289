// =============================================================================
// infinium-norm - Compressed Stream Implementation
// =============================================================================

#include "inorm/io/compressed_stream.h"

#include <zlib.h>

#include <array>
#include <string>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"

namespace inorm::io {

namespace {

constexpr std::array<std::uint8_t, 2> kGzipMagic = {0x1f, 0x8b};

// 16 + MAX_WBITS: expect a gzip header and trailer rather than raw zlib
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

/// @brief Read the magic bytes and rewind.
[[nodiscard]] CompressionFormat sniffFormat(std::ifstream& file) {
    std::array<char, kGzipMagic.size()> head{};
    file.read(head.data(), static_cast<std::streamsize>(head.size()));
    const auto count = static_cast<std::size_t>(file.gcount());
    file.clear();
    file.seekg(0, std::ios::beg);
    return detectCompressionFormat(
        {reinterpret_cast<const std::uint8_t*>(head.data()), count});
}

}  // namespace

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < kGzipMagic.size()) {
        return CompressionFormat::kNone;
    }
    return data[0] == kGzipMagic[0] && data[1] == kGzipMagic[1] ? CompressionFormat::kGzip
                                                                : CompressionFormat::kNone;
}

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief zlib inflate state together with its pending input.
struct GzipStreamBuf::Inflater {
    z_stream zs{};
    std::vector<std::uint8_t> pending;

    explicit Inflater(std::size_t chunkSize) : pending(chunkSize) {
        const int rc = inflateInit2(&zs, kGzipWindowBits);
        if (rc != Z_OK) {
            throw IOError("Failed to initialize zlib: " + std::string(zError(rc)));
        }
    }

    ~Inflater() { inflateEnd(&zs); }

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    /// @return false once the source is exhausted.
    bool feed(std::istream& source) {
        source.read(reinterpret_cast<char*>(pending.data()),
                    static_cast<std::streamsize>(pending.size()));
        const auto count = static_cast<std::size_t>(source.gcount());
        zs.next_in = pending.data();
        zs.avail_in = static_cast<uInt>(count);
        return count > 0;
    }
};

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t chunkSize)
    : source_(source), inflater_(std::make_unique<Inflater>(chunkSize)), decoded_(chunkSize) {}

GzipStreamBuf::~GzipStreamBuf() = default;

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    const std::size_t produced = inflateChunk();
    if (produced == 0) {
        return traits_type::eof();
    }
    setg(decoded_.data(), decoded_.data(), decoded_.data() + produced);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::inflateChunk() {
    if (finished_) {
        return 0;
    }
    z_stream& zs = inflater_->zs;
    zs.next_out = reinterpret_cast<Bytef*>(decoded_.data());
    zs.avail_out = static_cast<uInt>(decoded_.size());

    // Stop as soon as anything has been produced so lines reach the parser early
    while (zs.avail_out == decoded_.size()) {
        if (zs.avail_in == 0 && !inflater_->feed(source_)) {
            // Source ended inside a member
            if (zs.total_in > 0) {
                throw IOError("Truncated gzip stream");
            }
            finished_ = true;
            break;
        }

        const int rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            if (zs.avail_in == 0 && !inflater_->feed(source_)) {
                finished_ = true;
                break;
            }
            // Next concatenated member; total_in restarts so an empty tail is not truncation
            inflateReset(&zs);
        } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
            throw IOError("Gzip decompression failed: " + std::string(zError(rc)));
        }
    }
    return decoded_.size() - zs.avail_out;
}

// =============================================================================
// CompressedInputStream
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr), file_(path, std::ios::binary) {
    if (!file_.is_open()) {
        throw IOError("Failed to open file", ErrorContext{path.string()});
    }

    format_ = sniffFormat(file_);
    if (format_ == CompressionFormat::kGzip) {
        gzip_ = std::make_unique<GzipStreamBuf>(file_);
        rdbuf(gzip_.get());
        INORM_LOG_DEBUG("Reading gzip input: {}", path.string());
    } else {
        rdbuf(file_.rdbuf());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IOError("Input path is a directory", ErrorContext{path.string()});
    }
    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace inorm::io
