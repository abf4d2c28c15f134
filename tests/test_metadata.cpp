#include <gtest/gtest.h>
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/metadata.hpp"

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    static size_t position(const std::string& xml, const std::string& needle) {
        size_t pos = xml.find(needle);
        EXPECT_NE(pos, std::string::npos) << needle;
        return pos;
    }
};

TEST_F(MetadataTest, ArtifactMetadataListsSortedVersions) {
    std::string xml = generate_artifact_metadata("com.example", "lib", {"1.10", "1.9", "2.0-SNAPSHOT", "1.9"},
                                                 "20240601120000");
    EXPECT_EQ(xml.rfind("<?xml", 0), 0u);
    EXPECT_NE(xml.find("<groupId>com.example</groupId>"), std::string::npos);
    EXPECT_NE(xml.find("<artifactId>lib</artifactId>"), std::string::npos);
    EXPECT_NE(xml.find("<latest>2.0-SNAPSHOT</latest>"), std::string::npos);
    EXPECT_NE(xml.find("<release>1.10</release>"), std::string::npos);
    EXPECT_NE(xml.find("<lastUpdated>20240601120000</lastUpdated>"), std::string::npos);

    EXPECT_LT(position(xml, "<version>1.9</version>"), position(xml, "<version>1.10</version>"));
    EXPECT_LT(position(xml, "<version>1.10</version>"), position(xml, "<version>2.0-SNAPSHOT</version>"));
    EXPECT_EQ(xml.find("<version>1.9</version>", position(xml, "<version>1.9</version>") + 1), std::string::npos);
}

TEST_F(MetadataTest, SnapshotOnlyArtifactHasNoRelease) {
    std::string xml = generate_artifact_metadata("g", "a", {"1.0-SNAPSHOT"}, "20240601120000");
    EXPECT_EQ(xml.find("<release>"), std::string::npos);
    EXPECT_NE(xml.find("<latest>1.0-SNAPSHOT</latest>"), std::string::npos);
}

TEST_F(MetadataTest, GenerationIsDeterministic) {
    std::vector<std::string> versions = {"2.0", "1.0"};
    EXPECT_EQ(generate_artifact_metadata("g", "a", versions, "20240101000000"),
              generate_artifact_metadata("g", "a", {"1.0", "2.0"}, "20240101000000"));
}

TEST_F(MetadataTest, GroupMetadataSortsPlugins) {
    std::string xml = generate_group_metadata({
        {"zeta-maven-plugin", "zeta", "zeta-maven-plugin"},
        {"alpha-maven-plugin", "alpha", "alpha-maven-plugin"},
        {"alpha-maven-plugin", "alpha", "alpha-maven-plugin"},
    });
    EXPECT_NE(xml.find("<prefix>alpha</prefix>"), std::string::npos);
    EXPECT_LT(position(xml, "<artifactId>alpha-maven-plugin</artifactId>"),
              position(xml, "<artifactId>zeta-maven-plugin</artifactId>"));

    ParsedMetadata parsed = parse_metadata(xml);
    ASSERT_EQ(parsed.plugins.size(), 2u);
    EXPECT_EQ(parsed.plugins[0].prefix, "alpha");
}

TEST_F(MetadataTest, VersionMetadataDescribesSnapshot) {
    SnapshotInfo info;
    info.timestamp = "20240601.120000";
    info.build_number = 4;
    info.entries.push_back({std::nullopt, "pom", "1.0-20240601.120000-4", "20240601120000"});
    info.entries.push_back({std::string("sources"), "jar", "1.0-20240601.120000-4", "20240601120000"});
    info.entries.push_back({std::nullopt, "jar", "1.0-20240601.120000-4", "20240601120000"});

    std::string xml = generate_version_metadata("com.example", "lib", "1.0-SNAPSHOT", info, "20240601120000");
    EXPECT_NE(xml.find("<version>1.0-SNAPSHOT</version>"), std::string::npos);
    EXPECT_NE(xml.find("<timestamp>20240601.120000</timestamp>"), std::string::npos);
    EXPECT_NE(xml.find("<buildNumber>4</buildNumber>"), std::string::npos);
    EXPECT_NE(xml.find("<classifier>sources</classifier>"), std::string::npos);
    // jar (no classifier), jar:sources, pom
    EXPECT_LT(position(xml, "<extension>jar</extension>"), position(xml, "<classifier>sources</classifier>"));
    EXPECT_LT(position(xml, "<classifier>sources</classifier>"), position(xml, "<extension>pom</extension>"));

    ParsedMetadata parsed = parse_metadata(xml);
    EXPECT_EQ(parsed.build_number, 4);
    EXPECT_EQ(parsed.snapshot_timestamp, "20240601.120000");
}

TEST_F(MetadataTest, ParsesVersionsBack) {
    ParsedMetadata parsed = parse_metadata(generate_artifact_metadata("g", "a", {"1.0", "1.1"}, "20240101000000"));
    EXPECT_EQ(parsed.versions, (std::vector<std::string>{"1.0", "1.1"}));
    EXPECT_FALSE(parsed.build_number.has_value());
}

TEST_F(MetadataTest, RejectsMalformedXml) {
    EXPECT_THROW(parse_metadata("<metadata><versioning>"), GhrelException);
    EXPECT_THROW(parse_metadata("<project/>"), GhrelException);
}
