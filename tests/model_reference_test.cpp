#include "core/model/ModelReference.hpp"

#include <gtest/gtest.h>

using namespace core::model;

TEST(ModelReferenceTest, ClassifiesByExtension) {
    EXPECT_EQ(ModelReference::classify("/models/part.stl"), ModelType::STL);
    EXPECT_EQ(ModelReference::classify("/models/PART.STL"), ModelType::STL);
    EXPECT_EQ(ModelReference::classify("/models/part.gcode"), ModelType::GCODE);
    EXPECT_EQ(ModelReference::classify("/models/part.obj"), ModelType::UNSUPPORTED);
    EXPECT_EQ(ModelReference::classify("/models/stl"), ModelType::UNSUPPORTED);
}

TEST(ModelReferenceTest, RemoteReferencesIgnoreQuery) {
    const std::string url = "https://example.com/files/part.stl?token=abc#top";
    EXPECT_TRUE(ModelReference::isRemote(url));
    EXPECT_EQ(ModelReference::classify(url), ModelType::STL);
    EXPECT_EQ(ModelReference::fileName(url), "part.stl");
}

TEST(ModelReferenceTest, LocalPathsAreNotRemote) {
    EXPECT_FALSE(ModelReference::isRemote("/tmp/http/part.stl"));
    EXPECT_FALSE(ModelReference::isRemote("ftp://example.com/part.stl"));
    EXPECT_EQ(ModelReference::fileName("part.gcode"), "part.gcode");
}
