#include <catch2/catch_test_macros.hpp>

#include <d2pak/archive/extract.hpp>

#include "helpers/mock_segments.hpp"
#include "helpers/test_utils.hpp"

#include <map>

using namespace d2pak;
using namespace d2pak::archive;
using test_helpers::bytes;
using test_helpers::make_linked_segment;
using test_helpers::make_segment;
using test_helpers::MockSegments;

TEST_CASE("extraction_path maps names under the destination", "[archive][extract]") {
    const std::filesystem::path dest = "/tmp/out";

    REQUIRE(extraction_path(dest, "a.txt") == dest / "a.txt");
    REQUIRE(extraction_path(dest, "gfx/items/1.png") == dest / "gfx/items/1.png");
    REQUIRE(extraction_path(dest, "gfx\\items\\2.png") == dest / "gfx/items/2.png");
    REQUIRE(extraction_path(dest, "./here.txt") == dest / "./here.txt");
}

TEST_CASE("extraction_path rejects names that escape", "[archive][extract]") {
    const std::filesystem::path dest = "/tmp/out";

    REQUIRE_FALSE(extraction_path(dest, "").has_value());
    REQUIRE_FALSE(extraction_path(dest, "/etc/passwd").has_value());
    REQUIRE_FALSE(extraction_path(dest, "../up.txt").has_value());
    REQUIRE_FALSE(extraction_path(dest, "gfx/../../up.txt").has_value());
    REQUIRE_FALSE(extraction_path(dest, "..\\up.txt").has_value());
}

TEST_CASE("extract writes every merged file", "[archive][extract]") {
    MockSegments segs;
    segs.add("gfx0.d2p", make_linked_segment({{"a.txt", bytes("first")}, {"dir/b.txt", bytes("old")}},
                                             "gfx1.d2p"));
    segs.add("gfx1.d2p", make_segment({{"dir/b.txt", bytes("new")}, {"dir/sub/empty", {}}}));

    MergeReader reader;
    REQUIRE(reader.merge("gfx0.d2p", segs.factory()));

    test_helpers::TempDir out("d2pak_extract");
    std::map<std::string, std::uint64_t> reported;

    ExtractOptions options;
    options.onFile = [&reported](const std::string& name, std::uint64_t size) { reported[name] = size; };

    Error err;
    auto written = extract(reader, out.path(), options, &err);
    REQUIRE(written.has_value());
    REQUIRE(*written == 3);

    REQUIRE(out.read_text("a.txt") == "first");
    REQUIRE(out.read_text("dir/b.txt") == "new");
    REQUIRE(std::filesystem::exists(out.path() / "dir/sub/empty"));
    REQUIRE(std::filesystem::file_size(out.path() / "dir/sub/empty") == 0);

    REQUIRE(reported.size() == 3);
    REQUIRE(reported["dir/b.txt"] == 3);
}

TEST_CASE("extract refuses names outside the destination", "[archive][extract]") {
    MockSegments segs;
    segs.add("evil.d2p", make_segment({{"../escape.txt", bytes("x")}}));

    MergeReader reader;
    REQUIRE(reader.merge("evil.d2p", segs.factory()));

    test_helpers::TempDir out("d2pak_extract");
    const auto dest = out.path() / "inner";

    Error err;
    REQUIRE_FALSE(extract(reader, dest, {}, &err).has_value());
    REQUIRE(err.code == ErrorCode::IoFailure);
    REQUIRE_FALSE(std::filesystem::exists(out.path() / "escape.txt"));
}

TEST_CASE("extract without overwrite keeps existing files", "[archive][extract]") {
    MockSegments segs;
    segs.add("a.d2p", make_segment({{"keep.txt", bytes("archive")}}));

    MergeReader reader;
    REQUIRE(reader.merge("a.d2p", segs.factory()));

    test_helpers::TempDir out("d2pak_extract");
    out.write_file("keep.txt", bytes("local"));

    ExtractOptions options;
    options.overwrite = false;

    Error err;
    REQUIRE_FALSE(extract(reader, out.path(), options, &err).has_value());
    REQUIRE(err.code == ErrorCode::IoFailure);
    REQUIRE(out.read_text("keep.txt") == "local");

    options.overwrite = true;
    REQUIRE(extract(reader, out.path(), options, &err) == std::optional<std::size_t>{1});
    REQUIRE(out.read_text("keep.txt") == "archive");
}
