#include "segment_writer.hpp"

#include "pak_codec.hpp"

#include <d2pak/core/byte_stream.hpp>

#include <algorithm>
#include <fstream>
#include <limits>

namespace d2pak::format {

namespace {

constexpr std::uint64_t kMaxSegmentSize = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());

// Chunk table, property table and Info for a segment whose data region ends at `tablesOffset`.
bool encode_tables(const std::vector<Chunk>& entries, const std::vector<Property>& properties,
                   std::uint64_t tablesOffset, ByteWriter& out, Error* outError) {
    for (const auto& entry : entries) {
        if (!write_chunk(out, entry, outError)) {
            if (outError) outError->message = "chunk \"" + entry.fullFileName + "\": " + outError->message;
            return false;
        }
    }

    const std::uint64_t propertiesOffset = tablesOffset + out.size();

    for (const auto& prop : properties) {
        if (!write_property(out, prop, outError)) {
            if (outError) outError->message = "property \"" + prop.key + "\": " + outError->message;
            return false;
        }
    }

    if (tablesOffset + out.size() + PAK_INFO_SIZE > kMaxSegmentSize) {
        return fail(outError, ErrorCode::InvalidArgument, "segment exceeds the 2 GiB format limit");
    }

    Info info;
    info.offset = PAK_HEADER_SIZE;
    info.size = static_cast<std::int32_t>(tablesOffset - PAK_HEADER_SIZE);
    info.chunksOffset = tablesOffset;
    info.chunksCount = static_cast<std::int32_t>(entries.size());
    info.propertiesOffset = propertiesOffset;
    info.propertiesCount = static_cast<std::int32_t>(properties.size());
    write_info(out, info);
    return true;
}

void upsert_property(std::vector<Property>& properties, const std::string& key, const std::string& value) {
    auto it = std::find_if(properties.begin(), properties.end(),
                           [&key](const Property& p) { return p.key == key; });
    if (it != properties.end()) {
        it->value = value;
    } else {
        properties.push_back(Property{key, value});
    }
}

} // namespace

SegmentWriter::SegmentWriter() = default;

SegmentWriter::~SegmentWriter() {
    if (file_ && !finalized_) {
        cancel();
    }
}

bool SegmentWriter::begin(const std::filesystem::path& segmentPath, Error* outError) {
    if (file_) {
        return fail(outError, ErrorCode::InvalidArgument, "writer already has an open segment");
    }

    outputPath_ = segmentPath;
    const std::string pathStr = segmentPath.string();
    file_ = std::fopen(pathStr.c_str(), "wb");
    if (!file_) {
        return fail(outError, ErrorCode::IoFailure, "cannot create " + pathStr);
    }

    ByteWriter header;
    write_header(header);
    if (std::fwrite(header.data().data(), 1, header.size(), file_) != header.size()) {
        std::fclose(file_);
        file_ = nullptr;
        return fail(outError, ErrorCode::IoFailure, "cannot write header to " + pathStr);
    }

    entries_.clear();
    properties_.clear();
    currentOffset_ = PAK_HEADER_SIZE;
    finalized_ = false;
    return true;
}

bool SegmentWriter::add_file(const std::string& archivePath, std::span<const std::uint8_t> data,
                             Error* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorCode::InvalidArgument, "no open segment");
    }

    if (currentOffset_ + data.size() > kMaxSegmentSize) {
        return fail(outError, ErrorCode::InvalidArgument,
                    "adding \"" + archivePath + "\" would exceed the 2 GiB format limit");
    }

    if (!data.empty()) {
        if (std::fwrite(data.data(), 1, data.size(), file_) != data.size()) {
            return fail(outError, ErrorCode::IoFailure, "write failed for \"" + archivePath + "\"");
        }
    }

    Chunk entry;
    entry.fullFileName = archivePath;
    entry.offset = static_cast<std::int32_t>(currentOffset_ - PAK_HEADER_SIZE);
    entry.size = static_cast<std::int32_t>(data.size());
    entries_.push_back(std::move(entry));

    currentOffset_ += data.size();
    return true;
}

bool SegmentWriter::add_file_from_disk(const std::string& archivePath,
                                       const std::filesystem::path& sourcePath, Error* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorCode::InvalidArgument, "no open segment");
    }

    std::ifstream src(sourcePath, std::ios::binary | std::ios::ate);
    if (!src) {
        return fail(outError, ErrorCode::IoFailure, "cannot open " + sourcePath.string());
    }

    const auto size = static_cast<std::size_t>(src.tellg());
    src.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(size);
    if (size > 0) {
        if (!src.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
            return fail(outError, ErrorCode::IoFailure, "cannot read " + sourcePath.string());
        }
    }

    return add_file(archivePath, data, outError);
}

bool SegmentWriter::set_property(const std::string& key, const std::string& value, Error* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorCode::InvalidArgument, "no open segment");
    }
    upsert_property(properties_, key, value);
    return true;
}

bool SegmentWriter::finalize(Error* outError) {
    if (!file_ || finalized_) {
        return fail(outError, ErrorCode::InvalidArgument, "no open segment");
    }

    ByteWriter tables;
    if (!encode_tables(entries_, properties_, currentOffset_, tables, outError)) {
        return false;
    }

    if (std::fwrite(tables.data().data(), 1, tables.size(), file_) != tables.size()) {
        return fail(outError, ErrorCode::IoFailure, "cannot write tables to " + outputPath_.string());
    }

    if (std::fclose(file_) != 0) {
        file_ = nullptr;
        return fail(outError, ErrorCode::IoFailure, "cannot close " + outputPath_.string());
    }
    file_ = nullptr;
    finalized_ = true;
    return true;
}

void SegmentWriter::cancel() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (!outputPath_.empty()) {
        std::error_code ec;
        std::filesystem::remove(outputPath_, ec);
        outputPath_.clear();
    }

    entries_.clear();
    properties_.clear();
    finalized_ = false;
}

bool encode_segment(const std::vector<std::pair<std::string, std::vector<std::uint8_t>>>& files,
                    const std::vector<Property>& properties,
                    std::vector<std::uint8_t>* outBytes,
                    Error* outError) {
    ByteWriter out;
    write_header(out);

    std::vector<Chunk> entries;
    entries.reserve(files.size());

    for (const auto& [name, data] : files) {
        if (out.size() + data.size() > kMaxSegmentSize) {
            return fail(outError, ErrorCode::InvalidArgument, "segment exceeds the 2 GiB format limit");
        }
        Chunk entry;
        entry.fullFileName = name;
        entry.offset = static_cast<std::int32_t>(out.size() - PAK_HEADER_SIZE);
        entry.size = static_cast<std::int32_t>(data.size());
        entries.push_back(std::move(entry));
        out.write_bytes(data);
    }

    std::vector<Property> props;
    for (const auto& prop : properties) {
        upsert_property(props, prop.key, prop.value);
    }

    ByteWriter tables;
    if (!encode_tables(entries, props, out.size(), tables, outError)) {
        return false;
    }
    out.write_bytes(tables.data());

    *outBytes = out.take();
    return true;
}

} // namespace d2pak::format
