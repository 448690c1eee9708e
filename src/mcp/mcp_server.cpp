#include <azmcp/mcp/mcp_server.hpp>

#include <azmcp/core/log.hpp>

#include <optional>
#include <string>

namespace azmcp {

McpServer::McpServer(Dispatcher dispatcher,
                     std::istream& in,
                     std::ostream& out,
                     size_t max_frame_bytes)
    : dispatcher_(std::move(dispatcher)),
      in_(in),
      out_(out),
      buffer_(max_frame_bytes) {}

ServerStats McpServer::Run() {
    LogInfo("mcp", "Serving " + dispatcher_.Identity().name + " " +
                       dispatcher_.Identity().version + " on stdio");

    while (true) {
        auto chunk = ReadChunk();
        if (chunk.empty()) break;
        buffer_.Append(chunk);
        DrainFrames();
    }

    stats_.malformed_headers = buffer_.DiscardedHeaders();
    if (buffer_.Size() > 0) {
        LogDebug("frame", "EOF with " + std::to_string(buffer_.Size()) +
                              " unframed bytes pending");
    }
    LogInfo("mcp", "EOF: " + std::to_string(stats_.frames_decoded) +
                       " frames, " + std::to_string(stats_.frames_dropped) +
                       " dropped, " + std::to_string(stats_.malformed_headers) +
                       " malformed headers, " +
                       std::to_string(stats_.oversized_frames) + " oversized, " +
                       std::to_string(stats_.responses_written) + " responses");
    return stats_;
}

std::string McpServer::ReadChunk() {
    // peek() blocks until a byte arrives or the stream ends.
    if (in_.peek() == std::char_traits<char>::eof()) {
        return {};
    }

    std::string chunk(kReadChunkBytes, '\0');
    auto n = in_.readsome(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (n <= 0) {
        // Unbuffered streams report nothing available; take the peeked byte.
        char c = 0;
        if (!in_.get(c)) return {};
        chunk.assign(1, c);
        return chunk;
    }
    chunk.resize(static_cast<size_t>(n));
    return chunk;
}

void McpServer::DrainFrames() {
    const auto discarded_before = buffer_.DiscardedHeaders();
    while (auto frame = buffer_.Next()) {
        auto response = HandleFrame(*frame);
        if (response) {
            WriteMessage(*response);
        }
    }
    if (buffer_.DiscardedHeaders() > discarded_before) {
        LogWarn("frame", "Discarded " +
                             std::to_string(buffer_.DiscardedHeaders() -
                                            discarded_before) +
                             " malformed header block(s)");
    }
}

std::optional<nlohmann::json> McpServer::HandleFrame(const Frame& frame) {
    if (frame.oversized) {
        ++stats_.oversized_frames;
        const auto message = "Frame body of " + std::to_string(*frame.oversized) +
                             " bytes exceeds the " +
                             std::to_string(buffer_.MaxBody()) + " byte limit";
        LogWarn("frame", message + "; skipped");
        return Dispatcher::MakeError(nullptr, rpc_error::kInternalError,
                                     "Internal error: " + message);
    }
    ++stats_.frames_decoded;

    auto message = nlohmann::json::parse(frame.body, nullptr,
                                         /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        ++stats_.frames_dropped;
        LogDebug("frame", "Dropping frame with invalid JSON body (" +
                              std::to_string(frame.body.size()) + " bytes)");
        return std::nullopt;
    }
    return dispatcher_.HandleMessage(message);
}

void McpServer::WriteMessage(const nlohmann::json& message) {
    const auto encoded = EncodeFrame(
        message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
    out_.flush();
    if (!out_) {
        LogError("mcp", "Failed to write response");
        return;
    }
    ++stats_.responses_written;
}

} // namespace azmcp
