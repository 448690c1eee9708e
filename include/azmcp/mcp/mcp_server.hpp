#pragma once

#include <azmcp/mcp/dispatcher.hpp>
#include <azmcp/mcp/frame_codec.hpp>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace azmcp {

// Counters reported by McpServer::Run() when the input stream ends.
struct ServerStats {
    size_t frames_decoded = 0;
    size_t frames_dropped = 0;     // body was not valid JSON
    size_t malformed_headers = 0;  // header blocks discarded by resync
    size_t oversized_frames = 0;   // bodies over the limit, skipped unread
    size_t responses_written = 0;
};

// ---------------------------------------------------------------------------
// McpServer — framed JSON-RPC server over a byte stream (stdin/stdout).
//
// Reads whatever bytes are available, extracts complete Content-Length
// frames, dispatches each message in arrival order and writes one framed
// response per request. A frame whose body exceeds the limit is skipped
// unread and answered with a -32603 error whose id is null. Runs until EOF
// on the input stream.
// ---------------------------------------------------------------------------
class McpServer {
public:
    static constexpr size_t kReadChunkBytes = 64 * 1024;

    explicit McpServer(Dispatcher dispatcher,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       size_t max_frame_bytes = kDefaultMaxFrameBytes);

    // Run the server loop (blocks until EOF on the input stream).
    ServerStats Run();

    // Decode one frame body and dispatch it. Returns the response, if any.
    [[nodiscard]] std::optional<nlohmann::json> HandleFrame(const Frame& frame);

    // Encode and write one response as a single write followed by a flush.
    void WriteMessage(const nlohmann::json& message);

    [[nodiscard]] const ServerStats& Stats() const noexcept { return stats_; }

private:
    // Blocks for at least one byte; empty result means EOF.
    std::string ReadChunk();
    void DrainFrames();

    Dispatcher dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    FrameBuffer buffer_;
    ServerStats stats_;
    std::mutex write_mutex_;
};

} // namespace azmcp
