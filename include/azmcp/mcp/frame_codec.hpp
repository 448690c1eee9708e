#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace azmcp {

// ---------------------------------------------------------------------------
// Frame codec — Content-Length framing over a raw byte stream.
//
// Wire format of one frame:
//
//   Content-Length: <decimal>\r\n
//   [Other-Header: value\r\n ...]
//   \r\n
//   <exactly Content-Length bytes of body>
//
// The header name is matched case-insensitively. Other headers are ignored.
// A header block without a usable Content-Length is discarded together with
// its terminating blank line, and decoding resumes with the bytes after it.
// A usable length above the body limit still frames its body: the frame is
// reported as oversized and exactly that many body bytes are skipped.
// ---------------------------------------------------------------------------

inline constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

// Default upper bound on a single frame body (8 MiB).
inline constexpr size_t kDefaultMaxFrameBytes = 8 * 1024 * 1024;

struct Frame {
    std::string body;
    // Announced body length when it exceeds the limit; body is then empty.
    std::optional<size_t> oversized;
};

// Outcome of one DecodeFrame call.
//
//   frame       set when a complete frame was found
//   consumed    bytes the caller must drop from the front of its buffer
//               (discarded header blocks plus the returned frame, if any)
//   discarded   number of malformed header blocks skipped
//   skip        bytes of an oversized body not yet in the buffer; the caller
//               drops that many bytes of future input
//
// No frame and consumed == 0 means "wait for more input": a header whose
// body is still incomplete is never consumed. An oversized frame is returned
// as soon as its header is complete.
struct DecodeResult {
    std::optional<Frame> frame;
    size_t consumed = 0;
    size_t discarded = 0;
    size_t skip = 0;
};

/// Parse the Content-Length value out of a header block (without the
/// terminating blank line). Returns nullopt when the header is absent or
/// not a non-negative decimal integer that fits in size_t.
std::optional<size_t> ParseContentLength(std::string_view header_block);

/// Decode the first complete frame in buffer. Never throws.
DecodeResult DecodeFrame(std::string_view buffer,
                         size_t max_body = kDefaultMaxFrameBytes);

/// "Content-Length: N\r\n\r\n" + payload.
std::string EncodeFrame(std::string_view payload);

// ---------------------------------------------------------------------------
// FrameBuffer — the accumulating read buffer of the server loop.
//
// Append() raw bytes as they arrive; Next() extracts complete frames in
// order. Between calls the buffer holds at most the bytes of frames that
// are not yet complete. Body bytes of an oversized frame are dropped as they
// arrive and never stored.
// ---------------------------------------------------------------------------
class FrameBuffer {
public:
    explicit FrameBuffer(size_t max_body = kDefaultMaxFrameBytes)
        : max_body_(max_body) {}

    void Append(std::string_view bytes);

    /// Returns the next complete frame, or nullopt if more input is needed.
    std::optional<Frame> Next();

    [[nodiscard]] size_t Size() const noexcept { return buffer_.size(); }
    [[nodiscard]] size_t MaxBody() const noexcept { return max_body_; }
    [[nodiscard]] size_t DiscardedHeaders() const noexcept { return discarded_; }
    [[nodiscard]] size_t OversizedFrames() const noexcept { return oversized_; }
    /// Oversized body bytes still expected on the stream.
    [[nodiscard]] size_t PendingSkip() const noexcept { return skip_; }

private:
    std::string buffer_;
    size_t max_body_;
    size_t discarded_ = 0;
    size_t oversized_ = 0;
    size_t skip_ = 0;
};

} // namespace azmcp
