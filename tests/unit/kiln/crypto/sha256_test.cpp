#include <gtest/gtest.h>
#include <kiln/crypto/sha256.h>

using namespace kiln;

TEST(Sha256, EmptyInput) {
    auto r = crypto::sha256Hex("");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, KnownVector) {
    auto r = crypto::sha256Hex("abc");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, DistinctInputsDiffer) {
    auto a = crypto::sha256Hex("kiln.test");
    auto b = crypto::sha256Hex("kiln.test ");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value().size(), 64u);
    EXPECT_NE(a.value(), b.value());
}
