#include "core/date_extractor.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);
    pdm::install_exiv2_log_forwarding();
    spdlog::info("Running gtests");
    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
