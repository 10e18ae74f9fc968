/**
 * @file io_error_test.cpp
 * @brief Unit tests for spindle::IoError messages.
 */

#include "include/io_error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>

using spindle::IoError;
using spindle::IoPhase;

/** @test Messages name the phase, the path and the errno. */
TEST(IoErrorMessage, IncludesPhaseAndPath) {
    auto err = IoError::from_code(IoPhase::CreateDestination, ENOSPC, "/data/bench");
    const std::string msg = err.message();
    EXPECT_NE(msg.find("create destination file"), std::string::npos);
    EXPECT_NE(msg.find("/data/bench"), std::string::npos);
    EXPECT_NE(msg.find("Disk Full"), std::string::npos);
    EXPECT_NE(msg.find(std::to_string(ENOSPC)), std::string::npos);
}

/** @test Well-known errnos get a readable explanation. */
TEST(IoErrorMessage, KnownErrnos) {
    EXPECT_NE(IoError::from_code(IoPhase::WriteSource, EROFS, "/f").message().find("Read-Only"),
              std::string::npos);
    EXPECT_NE(IoError::from_code(IoPhase::WriteSource, EDQUOT, "/f").message().find("quota"),
              std::string::npos);
    EXPECT_NE(IoError::from_code(IoPhase::CreateSource, EACCES, "/f").message().find("Cannot create"),
              std::string::npos);
}

/** @test Detail text replaces the errno explanation. */
TEST(IoErrorMessage, InvalidArgumentDetail) {
    auto err = IoError::invalid("size range min 5 exceeds max 1");
    EXPECT_EQ(err.phase, IoPhase::InvalidArgument);
    EXPECT_EQ(err.message(), "invalid argument: size range min 5 exceeds max 1");
}

/** @test Every phase has a name. */
TEST(IoErrorPhase, Names) {
    EXPECT_EQ(spindle::phase_name(IoPhase::OpenSource), "open source file");
    EXPECT_EQ(spindle::phase_name(IoPhase::RemoveDestination), "remove destination file");
    EXPECT_EQ(spindle::phase_name(IoPhase::RandomBytes), "random bytes");
}
