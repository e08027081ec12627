// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <string>

namespace meetlink
{

/// @brief Hands closed segments to an external transcriber as WAV files.
///
/// Each segment becomes `segment-<id>-<speaker>-<startMs>.wav` (16-bit PCM, mono) in the
/// spool directory. With an empty directory the spool only logs segment metadata.
class SegmentSpool
{
  public:
    explicit SegmentSpool(std::filesystem::path directory);

    /// @brief Writes one segment.
    /// @return Success, or an IoError when the directory or file cannot be written.
    [[nodiscard]] auto write(const Segment& segment) -> VoidResult;

    /// @brief The file name a segment is written to.
    [[nodiscard]] static auto fileNameFor(const Segment& segment) -> std::string;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return _directory; }

  private:
    std::filesystem::path _directory;
};

} // namespace meetlink
