/**
 * @file test_options.cpp
 * @brief Unit tests for command-line option parsing
 */

#include <ImgEntropy/CLI/Options.h>
#include <ImgEntropy/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Img::Entropy;
using namespace Img::Entropy::CLI;

TEST(CliOptionsTest, Defaults) {
    CliOptions options = ParseCliOptions(std::vector<std::string>{"-i", "photo.png"});
    EXPECT_EQ(options.input, "photo.png");
    EXPECT_EQ(options.method, MethodKind::Delentropy2D);
    EXPECT_EQ(options.kernelSize, 11);
    EXPECT_EQ(options.radius, 5);
    EXPECT_TRUE(options.outputDir.empty());
    EXPECT_TRUE(options.show);
    EXPECT_FALSE(options.quiet);
    EXPECT_FALSE(options.help);
}

TEST(CliOptionsTest, AllFlags) {
    CliOptions options = ParseCliOptions(std::vector<std::string>{
        "--input", "a.jpg", "--method", "2d-regional-shannon", "--kernel-size", "7",
        "-r", "3", "-o", "out", "--no-show", "-q"});
    EXPECT_EQ(options.input, "a.jpg");
    EXPECT_EQ(options.method, MethodKind::RegionalShannon2D);
    EXPECT_EQ(options.kernelSize, 7);
    EXPECT_EQ(options.radius, 3);
    EXPECT_EQ(options.outputDir, "out");
    EXPECT_FALSE(options.show);
    EXPECT_TRUE(options.quiet);
}

TEST(CliOptionsTest, AttachedValues) {
    CliOptions options = ParseCliOptions(std::vector<std::string>{
        "--input=a b.png", "--method=2d-regional-scikit", "--kernel-size=5", "-r7", "-oout"});
    EXPECT_EQ(options.input, "a b.png");
    EXPECT_EQ(options.method, MethodKind::RegionalScikit2D);
    EXPECT_EQ(options.kernelSize, 5);
    EXPECT_EQ(options.radius, 7);
    EXPECT_EQ(options.outputDir, "out");

    CliOptions shortForm = ParseCliOptions(std::vector<std::string>{"-ix.png", "-k9", "-m1d-kapur"});
    EXPECT_EQ(shortForm.input, "x.png");
    EXPECT_EQ(shortForm.kernelSize, 9);
    EXPECT_EQ(shortForm.method, MethodKind::Kapur1D);
}

TEST(CliOptionsTest, AttachedValuesAreValidated) {
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "--kernel-size=4"}),
                 InvalidArgumentException);
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "-k"}),
                 InvalidArgumentException);
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "--kernel-size="}),
                 InvalidArgumentException);
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "--quiet=yes"}),
                 InvalidArgumentException);
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "-q1"}),
                 InvalidArgumentException);
}

TEST(CliOptionsTest, ArgvOverloadSkipsProgramName) {
    const char* argv[] = {"image_entropy", "-m", "1d-kapur", "-i", "x.png"};
    CliOptions options = ParseCliOptions(5, argv);
    EXPECT_EQ(options.method, MethodKind::Kapur1D);
    EXPECT_EQ(options.input, "x.png");
}

TEST(CliOptionsTest, KernelSizeValidation) {
    EXPECT_EQ(ParseKernelSize("3"), 3);
    EXPECT_EQ(ParseKernelSize("21"), 21);
    EXPECT_THROW(ParseKernelSize("4"), InvalidArgumentException);
    EXPECT_THROW(ParseKernelSize("1"), InvalidArgumentException);
    EXPECT_THROW(ParseKernelSize("-3"), InvalidArgumentException);
    EXPECT_THROW(ParseKernelSize("abc"), InvalidArgumentException);
    EXPECT_THROW(ParseKernelSize("3.5"), InvalidArgumentException);

    try {
        ParseKernelSize("8");
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_NE(std::string(e.what()).find("8 is not a valid kernel size."), std::string::npos);
    }
}

TEST(CliOptionsTest, RadiusValidation) {
    EXPECT_EQ(ParseRadius("1"), 1);
    EXPECT_THROW(ParseRadius("0"), InvalidArgumentException);
    EXPECT_THROW(ParseRadius("two"), InvalidArgumentException);
}

TEST(CliOptionsTest, UnknownMethodThrows) {
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "-m", "nope"}),
                 InvalidArgumentException);
}

TEST(CliOptionsTest, MissingInputThrows) {
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-m", "1d-shannon"}),
                 InvalidArgumentException);
}

TEST(CliOptionsTest, MissingValueThrows) {
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i"}), InvalidArgumentException);
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "-k"}),
                 InvalidArgumentException);
}

TEST(CliOptionsTest, UnrecognizedArgumentThrows) {
    EXPECT_THROW(ParseCliOptions(std::vector<std::string>{"-i", "a.png", "--verbose"}),
                 InvalidArgumentException);
}

TEST(CliOptionsTest, HelpDoesNotNeedInput) {
    CliOptions options = ParseCliOptions(std::vector<std::string>{"--help"});
    EXPECT_TRUE(options.help);
}

TEST(CliOptionsTest, UsageListsMethods) {
    std::string usage = Usage("image_entropy");
    EXPECT_NE(usage.find("usage: image_entropy"), std::string::npos);
    for (const auto& info : ListMethods()) {
        EXPECT_NE(usage.find(info.name), std::string::npos);
    }
}
