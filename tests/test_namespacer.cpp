#include <gtest/gtest.h>

#include "schema/namespacer.h"

using namespace docbridge;

TEST(NamespacerTest, NamespaceOfUsesLastSegmentSingularUnderscored) {
    EXPECT_EQ(Namespacer::namespaceOf("UserProfiles"), "user_profile");
    EXPECT_EQ(Namespacer::namespaceOf("Accounts.User"), "user");
    EXPECT_EQ(Namespacer::namespaceOf("Shop.Categories"), "category");
    EXPECT_EQ(Namespacer::namespaceOf("People"), "person");
    EXPECT_EQ(Namespacer::namespaceOf("Address"), "address");
    EXPECT_EQ(Namespacer::namespaceOf("HTTPRequests"), "http_request");
}

TEST(NamespacerTest, Singularize) {
    EXPECT_EQ(Namespacer::singularize("boxes"), "box");
    EXPECT_EQ(Namespacer::singularize("matches"), "match");
    EXPECT_EQ(Namespacer::singularize("statuses"), "status");
    EXPECT_EQ(Namespacer::singularize("status"), "status");
    EXPECT_EQ(Namespacer::singularize("class"), "class");
    EXPECT_EQ(Namespacer::singularize("user"), "user");
}

TEST(NamespacerTest, QualifyIsIdempotent) {
    EXPECT_EQ(Namespacer::qualify("user", "1"), "user/1");
    EXPECT_EQ(Namespacer::qualify("user", "user/1"), "user/1");
    EXPECT_EQ(Namespacer::qualify("user", Namespacer::qualify("user", "abc")), "user/abc");
    // Nur exakter Namespace-Präfix zählt
    EXPECT_EQ(Namespacer::qualify("user", "users/1"), "user/users/1");
    EXPECT_EQ(Namespacer::qualify("user", "user"), "user/user");
}

TEST(NamespacerTest, UnqualifyRoundTrip) {
    for (const char* id : {"1", "a b", "x/y", "user", "ünï", ""}) {
        EXPECT_EQ(Namespacer::unqualify("user", Namespacer::qualify("user", id)), id) << id;
    }
    // Bereits qualifizierte Eingabe: lokaler Teil, kein Doppelpräfix
    EXPECT_EQ(Namespacer::unqualify("user", Namespacer::qualify("user", "user/1")), "1");
    EXPECT_EQ(Namespacer::qualify("user", Namespacer::unqualify("user", "user/1")), "user/1");
    EXPECT_EQ(Namespacer::unqualify("user", "other/1"), "other/1");
    EXPECT_EQ(Namespacer::unqualify("user", "user/user/1"), "user/1");
}

TEST(NamespacerTest, BaseIdStripsOneSegment) {
    EXPECT_EQ(Namespacer::baseId("user/1"), "1");
    EXPECT_EQ(Namespacer::baseId("1"), "1");
    EXPECT_EQ(Namespacer::baseId("a/b/c"), "b/c");
    EXPECT_EQ(Namespacer::baseId("/x"), "/x");
}

TEST(NamespacerTest, ScanBounds) {
    EXPECT_EQ(Namespacer::scanStartKey("user"), "user");
    EXPECT_EQ(Namespacer::scanEndKey("user"), "user/{}");
}

TEST(NamespacerTest, TransportEncoding) {
    EXPECT_EQ(Namespacer::encodeForTransport("user/1"), "user%2F1");
    EXPECT_EQ(Namespacer::encodeForTransport("user-a@b.com"), "user-a%40b.com");
    EXPECT_EQ(Namespacer::encodeForTransport("a b~c_d"), "a+b~c_d");
    EXPECT_EQ(Namespacer::encodeForTransport("ä"), "%C3%A4");

    for (const char* id : {"user/1", "user-a@b.com", "a b+c", "x%y", "ä/ö"}) {
        EXPECT_EQ(Namespacer::decodeFromTransport(Namespacer::encodeForTransport(id)), id) << id;
    }
}

TEST(NamespacerTest, DecodeKeepsMalformedSequences) {
    EXPECT_EQ(Namespacer::decodeFromTransport("100%"), "100%");
    EXPECT_EQ(Namespacer::decodeFromTransport("%zz"), "%zz");
    EXPECT_EQ(Namespacer::decodeFromTransport("%4"), "%4");
    EXPECT_EQ(Namespacer::decodeFromTransport("%41"), "A");
}
