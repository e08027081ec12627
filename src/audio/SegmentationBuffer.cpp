// SPDX-License-Identifier: Apache-2.0
#include "SegmentationBuffer.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <exception>

namespace meetlink
{

SegmentationBuffer::SegmentationBuffer(SegmentationConfig config, SegmentSink sink):
    _config(config), _sink(std::move(sink))
{
}

void SegmentationBuffer::push(std::shared_ptr<const AudioChunk> chunk, bool isActive)
{
    if (!chunk)
        return;

    auto const now = chunk->capturedAtMs;
    auto const speakerId = chunk->speakerHint.value_or(std::string {});

    // A chunk captured after the silence window elapsed starts a new utterance,
    // even when no poll() ran in between.
    auto it = _open.find(speakerId);
    if (it != _open.end() && now - it->second.lastActiveMs >= _config.silenceTimeoutMs)
    {
        close(it, SegmentCloseReason::Silence);
        it = _open.end();
    }

    if (it == _open.end())
    {
        if (!isActive)
        {
            dispatchPending();
            return;
        }

        auto open = OpenSegment {
            .segment = Segment {
                .id = _nextSegmentId++,
                .speakerId = speakerId,
                .startMs = now,
                .endMs = now,
                .chunks = {},
                .state = SegmentState::Open,
                .closeReason = SegmentCloseReason::Silence,
            },
            .lastActiveMs = now,
        };
        it = _open.emplace(speakerId, std::move(open)).first;
        log::trace("Segment #{} opened for speaker '{}' at {} ms", it->second.segment.id, speakerId, now);
    }

    auto& open = it->second;
    auto const activeUntil = now + chunk->durationMs();
    open.segment.chunks.push_back(std::move(chunk));
    open.segment.endMs = std::max(open.segment.endMs, now);
    if (isActive)
        open.lastActiveMs = std::max(open.lastActiveMs, activeUntil);

    if (auto const reason = expiryReason(open, now))
        close(it, *reason);

    dispatchPending();
}

void SegmentationBuffer::poll(int64_t nowMs)
{
    for (auto it = _open.begin(); it != _open.end();)
    {
        auto const current = it++;
        if (auto const reason = expiryReason(current->second, nowMs))
            close(current, *reason);
    }

    dispatchPending();
}

void SegmentationBuffer::flush()
{
    while (!_open.empty())
        close(_open.begin(), SegmentCloseReason::Forced);

    dispatchPending();
}

void SegmentationBuffer::closeSpeaker(std::string_view speakerId)
{
    if (auto it = _open.find(speakerId); it != _open.end())
        close(it, SegmentCloseReason::Forced);

    dispatchPending();
}

auto SegmentationBuffer::hasOpenSegment(std::string_view speakerId) const -> bool
{
    return _open.find(speakerId) != _open.end();
}

auto SegmentationBuffer::expiryReason(const OpenSegment& open, int64_t nowMs) const
    -> std::optional<SegmentCloseReason>
{
    if (nowMs - open.lastActiveMs >= _config.silenceTimeoutMs)
        return SegmentCloseReason::Silence;
    if (nowMs - open.segment.startMs >= _config.maxSegmentMs)
        return SegmentCloseReason::MaxDuration;
    return std::nullopt;
}

void SegmentationBuffer::close(OpenMap::iterator it, SegmentCloseReason reason)
{
    auto segment = std::move(it->second.segment);
    _open.erase(it);

    segment.state = SegmentState::Closed;
    segment.closeReason = reason;

    log::debug("Segment #{} closed ({}): speaker '{}', [{}, {}] ms, {} chunk(s)",
               segment.id,
               segmentCloseReasonToString(reason),
               segment.speakerId,
               segment.startMs,
               segment.endMs,
               segment.chunks.size());

    _pending.push_back(std::move(segment));
}

void SegmentationBuffer::dispatchPending()
{
    while (!_pending.empty())
    {
        auto& segment = _pending.front();

        auto result = VoidResult {};
        if (_sink)
        {
            try
            {
                result = _sink(segment);
            }
            catch (const std::exception& e)
            {
                result = makeError(ErrorCode::IoError, e.what());
            }
            catch (...)
            {
                result = makeError(ErrorCode::IoError, "segment sink threw a non-standard exception");
            }
        }

        if (!result)
        {
            log::warning("Segment #{} hand-off failed, will retry: {}", segment.id, result.error());
            return;
        }

        segment.state = SegmentState::Dispatched;
        ++_dispatched;
        _pending.pop_front();
    }
}

} // namespace meetlink
