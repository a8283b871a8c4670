/**
 * @file    main.cpp
 * @brief   PhotoDateMark - CLI Entry Point
 * @license MIT
 *
 * @details
 * Stamps JPEG/PNG photos with the date they were taken, read from the
 * EXIF (or XMP) capture-time metadata.
 *
 * Usage:
 *   PhotoDateMark                                       (fully interactive)
 *   PhotoDateMark -i ./trip -s 48 -c white -p right_bottom
 *   PhotoDateMark -i ./trip/IMG_0001.jpg -c 白色 -p 右下 -s 36
 *   PhotoDateMark --config stamp.ini
 *
 * Output goes to a sibling directory named "<folder>_watermark".
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return pdm::cli::run(argc, argv);
}
