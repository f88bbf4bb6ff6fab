/**
 * @file test_fingerprint.cpp
 * @brief Unit tests for the Fingerprint signature engine and Sha256 hasher
 *
 * @see Fingerprint
 * @see Sha256
 */

#include <gtest/gtest.h>
#include "fingerprint.hpp"
#include "sha256.hpp"

/**
 * @class FingerprintTest
 * @brief Fixture holding a Fingerprint bound to the SHA-256 hasher
 */
class FingerprintTest : public ::testing::Test {
protected:
    Sha256 hasher;
    Fingerprint fingerprint{hasher};
};

TEST(Sha256Test, MatchesKnownVectors) {
    Sha256 hasher;
    EXPECT_EQ(hasher.calculateHash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hasher.calculateHash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(FingerprintTest, NormalizesExtensions) {
    EXPECT_EQ(Fingerprint::normalizeExtension("main.GO"), ".go");
    EXPECT_EQ(Fingerprint::normalizeExtension("archive.tar.gz"), ".gz");
    EXPECT_EQ(Fingerprint::normalizeExtension("Makefile"), "<noext>");
    EXPECT_EQ(Fingerprint::normalizeExtension(".bashrc"), ".bashrc");
    EXPECT_EQ(Fingerprint::normalizeExtension("trailing."), ".");
}

TEST_F(FingerprintTest, DirectorySignatureIsTagged) {
    auto sig = fingerprint.forDirectory({}, {});
    EXPECT_EQ(sig.rfind("d:", 0), 0u);
    EXPECT_EQ(sig.size(), 2u + 64u);
}

TEST_F(FingerprintTest, ChildOrderDoesNotMatter) {
    ExtensionHistogram ext{{".go", 2}};
    auto a = fingerprint.forDirectory(ext, {"d:one", "d:two", "d:three"});
    auto b = fingerprint.forDirectory(ext, {"d:three", "d:one", "d:two"});
    EXPECT_EQ(a, b);
}

TEST_F(FingerprintTest, CountsMatter) {
    auto one = fingerprint.forDirectory({{".go", 1}}, {});
    auto two = fingerprint.forDirectory({{".go", 2}}, {});
    EXPECT_NE(one, two);
}

TEST_F(FingerprintTest, ChildMultiplicityMatters) {
    auto once = fingerprint.forDirectory({}, {"d:x"});
    auto twice = fingerprint.forDirectory({}, {"d:x", "d:x"});
    EXPECT_NE(once, twice);
}

TEST_F(FingerprintTest, FieldBoundariesAreUnambiguous) {
    // ".a" + ".b" must not read the same as ".a.b"
    auto split = fingerprint.forDirectory({{".a", 1}, {".b", 1}}, {});
    auto joined = fingerprint.forDirectory({{".a.b", 1}}, {});
    EXPECT_NE(split, joined);

    auto twoChildren = fingerprint.forDirectory({}, {"ab", "c"});
    auto otherSplit = fingerprint.forDirectory({}, {"a", "bc"});
    EXPECT_NE(twoChildren, otherSplit);
}

TEST_F(FingerprintTest, FilesAndDirsAreSeparateFields) {
    auto asFile = fingerprint.forDirectory({{"d:x", 1}}, {});
    auto asDir = fingerprint.forDirectory({}, {"d:x"});
    EXPECT_NE(asFile, asDir);
}

TEST_F(FingerprintTest, UnknownContentsDependsOnPath) {
    auto a = fingerprint.forUnknownContents("/tmp/root/a");
    auto b = fingerprint.forUnknownContents("/tmp/root/b");
    EXPECT_NE(a, b);
    EXPECT_EQ(a, fingerprint.forUnknownContents("/tmp/root/a"));
    EXPECT_EQ(a.rfind("l:", 0), 0u);
}

TEST_F(FingerprintTest, ErrorSignatureDependsOnPathAndKind) {
    auto perm = fingerprint.forError("/tmp/x", ReadErrorKind::PermissionDenied);
    auto other = fingerprint.forError("/tmp/x", ReadErrorKind::Other);
    auto elsewhere = fingerprint.forError("/tmp/y", ReadErrorKind::PermissionDenied);

    EXPECT_NE(perm, other);
    EXPECT_NE(perm, elsewhere);
    EXPECT_NE(perm, fingerprint.forDirectory({}, {}));
    EXPECT_EQ(perm.rfind("e:", 0), 0u);
}

TEST_F(FingerprintTest, FallbackUsesNameAndDepth) {
    EXPECT_EQ(Fingerprint::fallback("src", 3), "name:src:level:3");
}

TEST(ReadErrorTest, OnlyPermissionFailuresAreDistinguished) {
    auto denied = ReadError::fromErrorCode(
        std::make_error_code(std::errc::permission_denied));
    auto missing = ReadError::fromErrorCode(
        std::make_error_code(std::errc::no_such_file_or_directory));
    auto notDir = ReadError::fromErrorCode(
        std::make_error_code(std::errc::not_a_directory));

    EXPECT_EQ(denied.kind, ReadErrorKind::PermissionDenied);
    EXPECT_EQ(missing.kind, ReadErrorKind::Other);
    EXPECT_EQ(notDir.kind, ReadErrorKind::Other);
    EXPECT_FALSE(missing.message.empty());
}
