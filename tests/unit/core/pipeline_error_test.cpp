#include "core/PipelineError.hpp"

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace core {
namespace {

TEST(PipelineErrorTest, SubclassesCarryTheirKind) {
    EXPECT_EQ(ModelLoadError("x").kind(), ErrorKind::ModelLoadFailure);
    EXPECT_EQ(ConfigurationError("x").kind(), ErrorKind::Configuration);
    EXPECT_EQ(InferenceError("x").kind(), ErrorKind::InferenceFailure);
    EXPECT_EQ(ShapeMismatchError(3, 4).kind(), ErrorKind::ShapeMismatch);
}

TEST(PipelineErrorTest, OnlyStartupFailuresAreStructural) {
    EXPECT_TRUE(isStructural(ErrorKind::ModelLoadFailure));
    EXPECT_TRUE(isStructural(ErrorKind::Configuration));
    EXPECT_FALSE(isStructural(ErrorKind::CaptureUnavailable));
    EXPECT_FALSE(isStructural(ErrorKind::ShapeMismatch));
    EXPECT_FALSE(isStructural(ErrorKind::InferenceFailure));
}

TEST(PipelineErrorTest, ShapeMismatchReportsBothSizes) {
    const ShapeMismatchError error(150528U, 10U);
    EXPECT_EQ(error.expected(), 150528U);
    EXPECT_EQ(error.actual(), 10U);

    const std::string message = error.what();
    EXPECT_NE(message.find("ShapeMismatch"), std::string::npos);
    EXPECT_NE(message.find("150528"), std::string::npos);
}

TEST(PipelineErrorTest, CatchableAsRuntimeError) {
    try {
        throw ConfigurationError("channels");
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("channels"), std::string::npos);
        return;
    }
    FAIL() << "ConfigurationError not caught as std::runtime_error";
}

} // namespace
} // namespace core
