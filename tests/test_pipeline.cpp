#include <gtest/gtest.h>

#include "filepipe/pipeline.hpp"

#include <vector>

namespace filepipe {
namespace {

using Chain = std::vector<Stage>;

TEST(PipelineTest, ParsesFromTheLastExtension) {
    EXPECT_EQ(ParseExtensionChain("a.tar.gz", false), (Chain{Stage::kGzip, Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("a.zip.gz", false), (Chain{Stage::kGzip, Stage::kZip}));
    EXPECT_EQ(ParseExtensionChain("a.tar", true), (Chain{Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("dir/x.gz", true), (Chain{Stage::kGzip}));
}

TEST(PipelineTest, ArchiveStageEndsTheChain) {
    EXPECT_EQ(ParseExtensionChain("a.gz.tar", false), (Chain{Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("a.tar.zip", false), (Chain{Stage::kZip}));
}

TEST(PipelineTest, ShortForms) {
    EXPECT_EQ(ParseExtensionChain("a.tgz", false), (Chain{Stage::kGzip, Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("a.tgz", true), (Chain{Stage::kGzip, Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("a.tbz", false), (Chain{Stage::kBzip2, Stage::kTar}));
}

TEST(PipelineTest, Bzip2OnlyWhenReading) {
    EXPECT_EQ(ParseExtensionChain("a.tar.bz2", false), (Chain{Stage::kBzip2, Stage::kTar}));
    EXPECT_TRUE(ParseExtensionChain("a.bz2", true).empty());
    EXPECT_TRUE(ParseExtensionChain("a.tbz", true).empty());
}

TEST(PipelineTest, CaseInsensitive) {
    EXPECT_EQ(ParseExtensionChain("A.TAR.GZ", false), (Chain{Stage::kGzip, Stage::kTar}));
    EXPECT_EQ(ParseExtensionChain("b.Zip", true), (Chain{Stage::kZip}));
}

TEST(PipelineTest, UnknownSuffixStops) {
    EXPECT_TRUE(ParseExtensionChain("notes.txt", false).empty());
    EXPECT_TRUE(ParseExtensionChain("a.tar.gz.bak", false).empty());
    EXPECT_TRUE(ParseExtensionChain("noext", false).empty());
    EXPECT_EQ(ParseExtensionChain("a.txt.gz", false), (Chain{Stage::kGzip}));
}

TEST(PipelineTest, DescribeChain) {
    EXPECT_EQ(DescribeChain({}), "none");
    EXPECT_EQ(DescribeChain({Stage::kGzip, Stage::kTar}), "gzip -> tar");
    EXPECT_EQ(DescribeChain({Stage::kZip}), "zip");
}

} // namespace
} // namespace filepipe
