#include "link_resolver.hpp"

namespace d2pak::archive {

std::filesystem::path resolve_link(const std::filesystem::path& initialPath, const std::string& linkValue) {
    const std::filesystem::path dir = initialPath.parent_path();
    if (dir.empty()) {
        return std::filesystem::path{linkValue};
    }
    return dir / linkValue;
}

std::string segment_file_name(const std::filesystem::path& firstSegment, std::uint32_t index) {
    return firstSegment.stem().string() + std::to_string(index) + firstSegment.extension().string();
}

} // namespace d2pak::archive
