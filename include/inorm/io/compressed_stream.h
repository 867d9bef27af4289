// =============================================================================
// infinium-norm - Compressed Stream Support
// =============================================================================
// Bead tables and manifests are read either as plain text or as gzip, chosen
// by the leading magic bytes rather than the file name. Concatenated gzip
// members (as produced by `cat a.gz b.gz`) decode as one table.
//
// Usage:
//   auto stream = openInputFile("/path/to/sample_beads.csv.gz");
//   std::getline(*stream, header);
// =============================================================================

#ifndef INORM_IO_COMPRESSED_STREAM_H
#define INORM_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <vector>

namespace inorm::io {

enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Plain text
    kGzip = 1
};

/// @brief Classify the first bytes of a file.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept;

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Read-only stream buffer inflating a gzip source.
class GzipStreamBuf : public std::streambuf {
public:
    /// @param source Compressed bytes; must outlive the buffer.
    explicit GzipStreamBuf(std::istream& source, std::size_t chunkSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    struct Inflater;

    /// @throws IOError on corrupt or truncated input.
    std::size_t inflateChunk();

    std::istream& source_;
    std::unique_ptr<Inflater> inflater_;
    std::vector<char> decoded_;
    bool finished_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief File stream that inflates gzip input and passes plain text through.
class CompressedInputStream : public std::istream {
public:
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    std::ifstream file_;
    std::unique_ptr<GzipStreamBuf> gzip_;
    CompressionFormat format_ = CompressionFormat::kNone;
};

/// @brief Open a bead table or manifest for reading.
/// @throws IOError if the path is a directory or cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace inorm::io

#endif  // INORM_IO_COMPRESSED_STREAM_H
