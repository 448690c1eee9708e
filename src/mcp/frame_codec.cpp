#include <azmcp/mcp/frame_codec.hpp>

#include <azmcp/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace azmcp {

namespace {

constexpr std::string_view kContentLength = "content-length";

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Strict non-negative decimal; rejects signs, blanks and overflow.
std::optional<size_t> ParseDecimal(std::string_view text) {
    constexpr size_t max = std::numeric_limits<size_t>::max();
    if (text.empty()) return std::nullopt;
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<size_t>(c - '0');
        if (value > (max - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // anonymous namespace

std::optional<size_t> ParseContentLength(std::string_view header_block) {
    while (!header_block.empty()) {
        auto eol = header_block.find('\n');
        auto line = header_block.substr(0, eol);
        header_block = (eol == std::string_view::npos)
                           ? std::string_view{}
                           : header_block.substr(eol + 1);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        if (!EqualsIgnoreCase(TrimWhitespace(line.substr(0, colon)),
                              kContentLength)) {
            continue;
        }
        // First Content-Length wins; a bad value makes the block malformed.
        return ParseDecimal(TrimWhitespace(line.substr(colon + 1)));
    }
    return std::nullopt;
}

DecodeResult DecodeFrame(std::string_view buffer, size_t max_body) {
    DecodeResult result;

    while (true) {
        auto pending = buffer.substr(result.consumed);
        auto header_end = pending.find(kHeaderTerminator);
        if (header_end == std::string_view::npos) {
            return result;
        }

        const auto body_start = header_end + kHeaderTerminator.size();
        auto length = ParseContentLength(pending.substr(0, header_end));
        if (!length.has_value()) {
            // Resynchronize: drop exactly this header block and its blank line.
            result.consumed += body_start;
            ++result.discarded;
            continue;
        }

        const auto available = pending.size() - body_start;
        if (*length > max_body) {
            const auto present = std::min(available, *length);
            result.frame = Frame{{}, *length};
            result.consumed += body_start + present;
            result.skip = *length - present;
            return result;
        }

        if (available < *length) {
            return result;
        }

        result.frame = Frame{std::string(pending.substr(body_start, *length)),
                             std::nullopt};
        result.consumed += body_start + *length;
        return result;
    }
}

std::string EncodeFrame(std::string_view payload) {
    std::string out = "Content-Length: " + std::to_string(payload.size());
    out += kHeaderTerminator;
    out += payload;
    return out;
}

void FrameBuffer::Append(std::string_view bytes) {
    const auto dropped = std::min(skip_, bytes.size());
    skip_ -= dropped;
    buffer_.append(bytes.substr(dropped));
}

std::optional<Frame> FrameBuffer::Next() {
    auto result = DecodeFrame(buffer_, max_body_);
    discarded_ += result.discarded;
    if (result.consumed > 0) {
        buffer_.erase(0, result.consumed);
    }
    skip_ += result.skip;
    if (result.frame && result.frame->oversized) ++oversized_;
    return std::move(result.frame);
}

} // namespace azmcp
