#include "face_matcher.hpp"
#include "test_support.hpp"

namespace {

GalleryEntry entry(const std::string &label, FaceEncoding enc) {
  GalleryEntry e;
  e.label = label;
  e.encoding = std::move(enc);
  return e;
}

} // namespace

TEST(FaceMatcherTest, FirstMatchWins) {
  FakeEncoder encoder;
  FaceMatcher matcher(encoder);
  Gallery gallery = {entry("x", {10, 20, 30}), entry("y", {10, 20, 30})};

  MatchResult result = matcher.match(solidImage(10, 20, 30), gallery);
  EXPECT_EQ(result.status, MatchStatus::MATCHED);
  EXPECT_EQ(result.label, "x");
}

TEST(FaceMatcherTest, FirstMatchNotBestMatch) {
  FakeEncoder encoder;
  FaceMatcher matcher(encoder);
  // "close" is within threshold but "exact" scores higher
  Gallery gallery = {entry("other", {0, 0, 1}), entry("close", {10, 20, 31}),
                     entry("exact", {10, 20, 30})};

  MatchResult result = matcher.match(solidImage(10, 20, 30), gallery);
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.label, "close");
  EXPECT_LT(result.score, 1.0f);
}

TEST(FaceMatcherTest, NoFaceInProbe) {
  FakeEncoder encoder;
  FaceMatcher matcher(encoder);
  Gallery gallery = {entry("x", {10, 20, 30})};

  MatchResult result = matcher.match(solidImage(0, 0, 0), gallery);
  EXPECT_EQ(result.status, MatchStatus::NO_FACE);
  EXPECT_TRUE(result.label.empty());
}

TEST(FaceMatcherTest, NoGalleryEntryMatches) {
  FakeEncoder encoder;
  FaceMatcher matcher(encoder);
  Gallery gallery = {entry("x", {1, 0, 0}), entry("y", {0, 1, 0})};

  MatchResult result = matcher.match(solidImage(10, 20, 30), gallery);
  EXPECT_EQ(result.status, MatchStatus::NO_MATCH);
  EXPECT_FALSE(result.matched());
}

TEST(FaceMatcherTest, EncoderFailureIsReported) {
  FakeEncoder encoder;
  FaceMatcher matcher(encoder);
  Gallery gallery = {entry("x", {10, 20, 30})};

  cv::Mat gray(16, 16, CV_8UC1, cv::Scalar(128));
  MatchResult result = matcher.match(gray, gallery);
  EXPECT_EQ(result.status, MatchStatus::ENCODE_FAILED);
  EXPECT_FALSE(result.error.empty());
}

TEST(FaceMatcherTest, ConvertsProbeToEncoderChannelOrder) {
  FakeEncoder encoder;
  encoder.order = ChannelOrder::RGB;
  FaceMatcher matcher(encoder);
  Gallery gallery = {entry("bgr", {10, 20, 30}), entry("rgb", {30, 20, 10})};

  // BGR frame (B=10, G=20, R=30) reaches the encoder as RGB
  MatchResult result = matcher.match(solidImage(10, 20, 30), gallery);
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.label, "rgb");
}
