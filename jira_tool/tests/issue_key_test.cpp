#include "errors.hpp"
#include "issue_key.hpp"
#include <gtest/gtest.h>

TEST(IssueKeyTest, KeepsBareKey) {
    EXPECT_EQ(IssueKey::normalize("PROJ-123").str(), "PROJ-123");
    EXPECT_EQ(IssueKey::normalize("AB2C-7").str(), "AB2C-7");
}

TEST(IssueKeyTest, ExtractsKeyFromBrowseUrl) {
    EXPECT_EQ(IssueKey::normalize("https://x/browse/PROJ-123").str(), "PROJ-123");
    EXPECT_EQ(IssueKey::normalize("https://company.atlassian.net/browse/OPS-42?focusedCommentId=1").str(), "OPS-42");
}

TEST(IssueKeyTest, TakesFirstEmbeddedKey) {
    EXPECT_EQ(IssueKey::normalize("https://x/browse/ABC-1/related/XYZ-2").str(), "ABC-1");
}

TEST(IssueKeyTest, RejectsInputWithoutKey) {
    EXPECT_THROW(IssueKey::normalize("no-key-here"), InvalidKeyError);
    EXPECT_THROW(IssueKey::normalize(""), InvalidKeyError);
    EXPECT_THROW(IssueKey::normalize("proj-123"), InvalidKeyError);
    EXPECT_THROW(IssueKey::normalize("1PROJ"), InvalidKeyError);
}

TEST(IssueKeyTest, ErrorCarriesOriginalInput) {
    try {
        IssueKey::normalize("no-key-here");
        FAIL() << "expected InvalidKeyError";
    } catch (const InvalidKeyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_KEY);
        EXPECT_EQ(e.input(), "no-key-here");
        EXPECT_NE(std::string(e.what()).find("no-key-here"), std::string::npos);
    }
}

TEST(IssueKeyTest, RecognisesKeyPattern) {
    EXPECT_TRUE(IssueKey::is_key("PROJ-1"));
    EXPECT_FALSE(IssueKey::is_key("PROJ-"));
    EXPECT_FALSE(IssueKey::is_key("PROJ-12a"));
    EXPECT_FALSE(IssueKey::is_key("-12"));
}
