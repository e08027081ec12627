// SPDX-License-Identifier: Apache-2.0
#include "SegmentSpool.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <cctype>
#include <format>

namespace meetlink
{

SegmentSpool::SegmentSpool(std::filesystem::path directory): _directory(std::move(directory))
{
}

auto SegmentSpool::fileNameFor(const Segment& segment) -> std::string
{
    auto speaker = std::string {};
    for (auto const c: segment.speakerId)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
            speaker += c;
        else
            speaker += '_';
    }
    if (speaker.empty())
        speaker = "default";

    return std::format("segment-{:06}-{}-{}.wav", segment.id, speaker, segment.startMs);
}

auto SegmentSpool::write(const Segment& segment) -> VoidResult
{
    if (_directory.empty())
    {
        log::info("Segment #{} ready: speaker '{}', {}..{} ms, {} bytes",
                  segment.id,
                  segment.speakerId,
                  segment.startMs,
                  segment.endMs,
                  segment.byteSize());
        return {};
    }

    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create spool directory '{}': {}", _directory.string(), ec.message()));

    auto const sampleRate = segment.chunks.empty() ? 16000u : segment.chunks.front()->sampleRate;
    auto const path = _directory / fileNameFor(segment);

    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, 1, sampleRate);
    auto encoder = ma_encoder {};
    if (ma_encoder_init_file(path.string().c_str(), &config, &encoder) != MA_SUCCESS)
        return makeError(ErrorCode::IoError, std::format("Cannot write segment file: {}", path.string()));

    auto result = VoidResult {};
    for (auto const& chunk: segment.chunks)
    {
        auto framesWritten = ma_uint64 { 0 };
        auto const rc =
            ma_encoder_write_pcm_frames(&encoder, chunk->payload.data(), chunk->sampleCount(), &framesWritten);
        if (rc != MA_SUCCESS)
        {
            result = makeError(ErrorCode::IoError,
                               std::format("Failed writing chunk #{} to {}: {}",
                                           chunk->sequenceId,
                                           path.string(),
                                           static_cast<int>(rc)));
            break;
        }
    }

    ma_encoder_uninit(&encoder);

    if (!result)
    {
        std::filesystem::remove(path, ec);
        return result;
    }

    log::debug("Segment #{} written to {}", segment.id, path.string());
    return {};
}

} // namespace meetlink
