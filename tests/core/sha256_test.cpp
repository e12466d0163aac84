// Tests for core/sha256.h -- content digests.

#include "core/sha256.h"

#include <gtest/gtest.h>

#include <string>

namespace calib {
namespace {

TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, TaggedFormat) {
  std::string tagged = sha256Tagged("abc");
  EXPECT_EQ(tagged.rfind("sha256:", 0), 0u);
  EXPECT_EQ(tagged.size(), 7u + 64u);
}

TEST(Sha256Test, DistinctInputsDistinctDigests) {
  EXPECT_NE(sha256Hex("{\"a\":1}"), sha256Hex("{\"a\":2}"));
  EXPECT_EQ(sha256Hex("same"), sha256Hex("same"));
}

}  // namespace
}  // namespace calib
