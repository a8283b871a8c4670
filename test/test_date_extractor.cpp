#include "core/date_extractor.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

using namespace pdm;
using namespace pdm::test;

TEST(DateExtractor, normalizes_exif_timestamp) {
    EXPECT_EQ(normalize_capture_date("2023:07:04 10:11:12"), "2023-07-04");
}

TEST(DateExtractor, normalizes_hyphenated_timestamp) {
    EXPECT_EQ(normalize_capture_date("2023-07-04 10:11:12"), "2023-07-04");
}

TEST(DateExtractor, normalizes_xmp_iso_timestamp) {
    EXPECT_EQ(normalize_capture_date("2023-07-04T10:11:12+02:00"), "2023-07-04");
}

TEST(DateExtractor, zero_pads_fields) {
    EXPECT_EQ(normalize_capture_date("2023:7:4 10:11:12"), "2023-07-04");
    EXPECT_EQ(normalize_capture_date("  2019:12:31  "), "2019-12-31");
}

TEST(DateExtractor, rejects_garbled_values) {
    EXPECT_FALSE(normalize_capture_date(""));
    EXPECT_FALSE(normalize_capture_date("   "));
    EXPECT_FALSE(normalize_capture_date("hello world"));
    EXPECT_FALSE(normalize_capture_date("2023:07 10:11:12"));
    EXPECT_FALSE(normalize_capture_date("2023/07/04 10:11:12"));
    EXPECT_FALSE(normalize_capture_date("2023:07:0x 10:11:12"));
    EXPECT_FALSE(normalize_capture_date("2023:13:01 00:00:00"));
    EXPECT_FALSE(normalize_capture_date("0000:00:00 00:00:00"));
}

TEST(DateExtractor, probe_order_prefers_original_then_exif) {
    const auto& probes = capture_date_probes();
    ASSERT_EQ(probes.size(), 4u);
    EXPECT_STREQ(probes[0].key, "Exif.Photo.DateTimeOriginal");
    EXPECT_STREQ(probes[1].key, "Exif.Image.DateTime");
    EXPECT_EQ(probes[0].source, MetadataSource::Exif);
    EXPECT_EQ(probes[2].source, MetadataSource::Xmp);
    EXPECT_EQ(probes[3].source, MetadataSource::Xmp);
}

TEST(DateExtractor, reads_date_time_original) {
    // GIVEN: a JPEG with a capture time
    TempDir tmp;
    const auto path = tmp.path() / "dated.jpg";
    write_dated_jpeg(path, "2023:07:04 10:11:12");

    // WHEN: we load it and extract the date
    SourceImage image = load_source_image(path);

    // THEN: the date part is returned
    EXPECT_EQ(extract_capture_date(image), "2023-07-04");
}

TEST(DateExtractor, original_wins_over_modification_time) {
    TempDir tmp;
    const auto path = tmp.path() / "both.jpg";
    write_dated_jpeg(path, "2020:01:02 03:04:05");
    tag_exif(path, "Exif.Image.DateTime", "2024:05:06 07:08:09");

    EXPECT_EQ(extract_capture_date(load_source_image(path)), "2020-01-02");
}

TEST(DateExtractor, falls_back_to_modification_time) {
    TempDir tmp;
    const auto path = tmp.path() / "modified.jpg";
    write_image(path, make_image(64, 48));
    tag_exif(path, "Exif.Image.DateTime", "2024:05:06 07:08:09");

    EXPECT_EQ(extract_capture_date(load_source_image(path)), "2024-05-06");
}

TEST(DateExtractor, falls_back_to_xmp_packet) {
    TempDir tmp;
    const auto path = tmp.path() / "xmp.jpg";
    write_image(path, make_image(64, 48));
    tag_xmp(path, "Xmp.exif.DateTimeOriginal", "2021-09-10T11:12:13");

    EXPECT_EQ(extract_capture_date(load_source_image(path)), "2021-09-10");
}

TEST(DateExtractor, unparseable_first_value_means_no_date) {
    // GIVEN: a garbled EXIF timestamp and a valid XMP one
    TempDir tmp;
    const auto path = tmp.path() / "garbled.jpg";
    write_dated_jpeg(path, "sometime last summer");
    tag_xmp(path, "Xmp.exif.DateTimeOriginal", "2021-09-10T11:12:13");

    // THEN: the first non-empty value decides, and it does not parse
    EXPECT_FALSE(extract_capture_date(load_source_image(path)));
}

TEST(DateExtractor, image_without_metadata_has_no_date) {
    TempDir tmp;
    const auto jpg = tmp.path() / "plain.jpg";
    const auto png = tmp.path() / "plain.png";
    write_image(jpg, make_image(64, 48));
    write_image(png, make_image(64, 48));

    EXPECT_FALSE(extract_capture_date(load_source_image(jpg)));
    EXPECT_FALSE(extract_capture_date(load_source_image(png)));
}

TEST(DateExtractor, unreadable_buffer_has_no_date) {
    const std::vector<unsigned char> junk = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    EXPECT_FALSE(extract_capture_date(junk));
    EXPECT_FALSE(extract_capture_date(std::vector<unsigned char>{}));
}

TEST(DateExtractor, load_rejects_corrupted_file) {
    TempDir tmp;
    const auto path = tmp.path() / "broken.jpg";
    write_garbage(path);

    EXPECT_THROW((void)load_source_image(path), std::runtime_error);
    EXPECT_THROW((void)load_source_image(tmp.path() / "missing.jpg"), std::runtime_error);
}

TEST(DateExtractor, malformed_exif_block_has_no_date) {
    // GIVEN: decodable pixels behind an Exif block with an out-of-range IFD offset
    TempDir tmp;
    const auto path = tmp.path() / "bad_exif.jpg";
    write_jpeg_with_corrupt_exif(path);

    // WHEN: the pixels still load
    SourceImage image = load_source_image(path);
    ASSERT_FALSE(image.pixels.empty());

    // THEN: extraction reports no date instead of throwing
    std::optional<std::string> date;
    EXPECT_NO_THROW(date = extract_capture_date(image));
    EXPECT_FALSE(date);
}
