#include <gtest/gtest.h>

#include "ota/update_descriptor.hpp"

namespace otafetch {
namespace {

TEST(DescriptorParserTest, ParsesFullDocument) {
    const std::string json = R"({
        "filename": "ota.zip",
        "size": 1000,
        "md5": "F508AA489132A4985042045DFEE3CC2A",
        "url": "file:///mirror/ota.zip",
        "version": "2.1.0",
        "force": true,
        "metadata": {"build_date": "2026-05-01", "build": 42}
    })";

    auto d = DescriptorParser().Parse(json);
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->file_name, "ota.zip");
    EXPECT_EQ(d->total_bytes, 1000u);
    EXPECT_EQ(d->checksum, "f508aa489132a4985042045dfee3cc2a");
    EXPECT_EQ(d->checksum_algorithm, DigestAlgorithm::kMd5);
    EXPECT_EQ(d->url, "file:///mirror/ota.zip");
    EXPECT_EQ(d->version, "2.1.0");
    EXPECT_TRUE(d->force);
    EXPECT_EQ(d->metadata.at("build_date"), "2026-05-01");
    EXPECT_EQ(d->metadata.at("build"), "42");
}

TEST(DescriptorParserTest, Sha256PreferredAndVersionDefaults) {
    const std::string json = R"({"filename": "a.img", "size": 0, "url": "/m/a.img",
        "sha256": "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"})";
    auto d = DescriptorParser().Parse(json);
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->checksum_algorithm, DigestAlgorithm::kSha256);
    EXPECT_EQ(d->version, "0.0.0");
    EXPECT_FALSE(d->force);
}

TEST(DescriptorParserTest, RejectsBadInput) {
    DescriptorParser p;
    EXPECT_FALSE(p.Parse("").has_value());
    EXPECT_FALSE(p.Parse("[]").has_value());

    auto syntax = p.Parse("{");
    ASSERT_FALSE(syntax.has_value());
    EXPECT_EQ(syntax.error().rfind("Syntax Error:", 0), 0u);

    const std::string md5 = R"("md5": "d41d8cd98f00b204e9800998ecf8427e")";
    EXPECT_FALSE(p.Parse(R"({"filename": "../x", "size": 1, "url": "u", )" + md5 + "}").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": -1, "url": "u", )" + md5 + "}").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": "1", "url": "u", )" + md5 + "}").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": 1, )" + md5 + "}").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": 1, "url": "u"})").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": 1, "url": "u", "md5": "abc"})").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": 1, "url": "u", "md5": "zz1d8cd98f00b204e9800998ecf8427e"})").has_value());
    EXPECT_FALSE(p.Parse(R"({"filename": "x", "size": 1, "url": "u", "metadata": 3, )" + md5 + "}").has_value());
}

} // namespace
} // namespace otafetch
