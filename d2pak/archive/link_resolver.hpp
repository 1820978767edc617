#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace d2pak::archive {

// Path of the segment named by a "link" property.
// The link value replaces the file name of `initialPath`; the directory of the
// initial archive is kept, whatever segment the link was found in.
// "data/gfx0.d2p" + "gfx1.d2p" -> "data/gfx1.d2p"; "gfx0.d2p" + "gfx1.d2p" -> "gfx1.d2p".
std::filesystem::path resolve_link(const std::filesystem::path& initialPath, const std::string& linkValue);

// Name of the N-th linked segment written by the packer: "gfx.d2p", 2 -> "gfx2.d2p".
std::string segment_file_name(const std::filesystem::path& firstSegment, std::uint32_t index);

} // namespace d2pak::archive
