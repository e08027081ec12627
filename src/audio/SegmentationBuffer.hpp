// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace meetlink
{

/// @brief Configuration for utterance segmentation.
struct SegmentationConfig
{
    /// @brief Silence after the last active chunk that closes a segment.
    int64_t silenceTimeoutMs = 500;

    /// @brief Upper bound on a segment's span, bounding transcription latency and memory.
    int64_t maxSegmentMs = 10000;
};

/// @brief Receives closed segments at the transcription boundary.
///
/// Returning an error keeps the segment queued; it is offered again on the next
/// push(), poll() or flush().
using SegmentSink = std::function<VoidResult(const Segment& segment)>;

/// @brief Cuts per-speaker chunk streams into utterance segments bounded by silence.
///
/// Each speaker runs an independent Silent → Open → Closed → Dispatched cycle, so
/// interleaved speakers never share a segment. Chunks without a speaker hint belong to
/// the implicit speaker "". Not thread-safe; the SessionController serializes access.
class SegmentationBuffer
{
  public:
    SegmentationBuffer(SegmentationConfig config, SegmentSink sink);

    SegmentationBuffer(const SegmentationBuffer&) = delete;
    SegmentationBuffer& operator=(const SegmentationBuffer&) = delete;

    /// @brief Routes a chunk into its speaker's segment stream.
    /// @param chunk The chunk (shared with the closed segment it ends up in).
    /// @param isActive Whether the chunk was classified as speech.
    ///
    /// An active chunk keeps its segment alive until the end of its audio. A chunk that
    /// arrives after the silence window elapsed closes the previous segment first.
    void push(std::shared_ptr<const AudioChunk> chunk, bool isActive);

    /// @brief Closes open segments whose silence timeout or duration cap has elapsed at @p nowMs.
    ///
    /// @p nowMs is a capture time: the end of the audio already pushed, not the wall clock.
    void poll(int64_t nowMs);

    /// @brief Force-closes and dispatches every open segment (session end or epoch change).
    void flush();

    /// @brief Force-closes one speaker's open segment, if any (mute boundary).
    void closeSpeaker(std::string_view speakerId);

    [[nodiscard]] auto hasOpenSegment(std::string_view speakerId) const -> bool;
    [[nodiscard]] auto openSegmentCount() const noexcept -> std::size_t { return _open.size(); }

    /// @brief Closed segments still waiting for a successful hand-off.
    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t { return _pending.size(); }

    [[nodiscard]] auto dispatchedCount() const noexcept -> uint64_t { return _dispatched; }

    [[nodiscard]] auto config() const noexcept -> const SegmentationConfig& { return _config; }

  private:
    struct OpenSegment
    {
        Segment segment;
        int64_t lastActiveMs = 0;
    };

    using OpenMap = std::map<std::string, OpenSegment, std::less<>>;

    void close(OpenMap::iterator it, SegmentCloseReason reason);
    [[nodiscard]] auto expiryReason(const OpenSegment& open, int64_t nowMs) const
        -> std::optional<SegmentCloseReason>;
    void dispatchPending();

    SegmentationConfig _config;
    SegmentSink _sink;
    OpenMap _open;
    std::deque<Segment> _pending;
    uint64_t _nextSegmentId = 1;
    uint64_t _dispatched = 0;
};

} // namespace meetlink
