#include "core/input_resolver.hpp"
#include "core/types.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using namespace pdm;
using namespace pdm::test;

TEST(InputResolver, supported_extensions_are_case_insensitive) {
    EXPECT_TRUE(is_supported_image("a.jpg"));
    EXPECT_TRUE(is_supported_image("a.JPG"));
    EXPECT_TRUE(is_supported_image("b.jpeg"));
    EXPECT_TRUE(is_supported_image("c.Png"));
    EXPECT_FALSE(is_supported_image("d.gif"));
    EXPECT_FALSE(is_supported_image("e.jpg.txt"));
    EXPECT_FALSE(is_supported_image("noext"));
}

TEST(InputResolver, lists_direct_children_only) {
    // GIVEN: a folder with images, a text file and a nested folder
    TempDir tmp;
    const auto dir = tmp.make_dir("photos");
    write_image(dir / "b.jpg", make_image(16, 16));
    write_image(dir / "a.PNG", make_image(16, 16));
    write_garbage(dir / "notes.txt");
    const auto nested = dir / "nested";
    fs::create_directories(nested);
    write_image(nested / "c.jpg", make_image(16, 16));

    // WHEN: we enumerate it
    const auto images = list_images(dir);

    // THEN: only the two direct images are found, sorted by name
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].filename(), "a.PNG");
    EXPECT_EQ(images[1].filename(), "b.jpg");
}

TEST(InputResolver, resolves_directory) {
    TempDir tmp;
    const auto dir = tmp.make_dir("trip");
    write_image(dir / "x.jpeg", make_image(16, 16));

    const ResolvedInput resolved = resolve_input(dir);

    EXPECT_FALSE(resolved.single_file);
    EXPECT_EQ(resolved.source_dir.filename(), "trip");
    ASSERT_EQ(resolved.targets.size(), 1u);
    EXPECT_TRUE(resolved.unsupported.empty());
}

TEST(InputResolver, resolves_single_supported_file) {
    TempDir tmp;
    const auto dir = tmp.make_dir("trip");
    write_image(dir / "x.jpg", make_image(16, 16));
    write_image(dir / "y.jpg", make_image(16, 16));

    const ResolvedInput resolved = resolve_input(dir / "x.jpg");

    EXPECT_TRUE(resolved.single_file);
    EXPECT_EQ(resolved.source_dir.filename(), "trip");
    ASSERT_EQ(resolved.targets.size(), 1u);
    EXPECT_EQ(resolved.targets[0].filename(), "x.jpg");
}

TEST(InputResolver, single_unsupported_file_yields_no_targets) {
    TempDir tmp;
    const auto dir = tmp.make_dir("trip");
    write_garbage(dir / "clip.gif");

    const ResolvedInput resolved = resolve_input(dir / "clip.gif");

    EXPECT_TRUE(resolved.targets.empty());
    ASSERT_EQ(resolved.unsupported.size(), 1u);
}

TEST(InputResolver, missing_path_is_invalid) {
    TempDir tmp;
    EXPECT_THROW((void)resolve_input(tmp.path() / "does_not_exist"), InvalidPathError);
    EXPECT_THROW(validate_input_path(""), InvalidPathError);
}

TEST(InputResolver, output_directory_is_a_sibling) {
    const fs::path source = fs::absolute("some_root") / "photos";

    EXPECT_EQ(output_dir_for(source), source.parent_path() / "photos_watermark");
    EXPECT_EQ(output_dir_for(source / ""), source.parent_path() / "photos_watermark");
    EXPECT_EQ(output_dir_for(source / "."), source.parent_path() / "photos_watermark");
}

TEST(InputResolver, ensure_output_dir_creates_then_reuses) {
    TempDir tmp;
    const auto dir = tmp.make_dir("album");

    const auto out = ensure_output_dir(dir);
    EXPECT_TRUE(fs::is_directory(out));
    EXPECT_EQ(out.filename(), "album_watermark");
    EXPECT_EQ(fs::absolute(out.parent_path()).lexically_normal(),
              fs::absolute(tmp.path()).lexically_normal());

    write_garbage(out / "keep.jpg");
    EXPECT_EQ(ensure_output_dir(dir), out);
    EXPECT_TRUE(fs::exists(out / "keep.jpg"));
}
