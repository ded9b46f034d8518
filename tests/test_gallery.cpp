#include "gallery.hpp"
#include "test_support.hpp"

class GalleryTest : public TempDirTest {
protected:
  FakeEncoder encoder;
};

TEST_F(GalleryTest, KeepsOrderAndSkipsBadFiles) {
  fs::path faces = root / "faces";
  writeImage(faces / "a.png", solidImage(10, 20, 30));
  writeText(faces / "b.png", "this is not an image");
  writeImage(faces / "c.jpg", solidImage(200, 100, 50));

  // A real PNG behind a non-image extension must be ignored
  writeImage(root / "d_source.png", solidImage(90, 90, 90));
  fs::rename(root / "d_source.png", faces / "d.txt");

  GalleryLoader loader(encoder);
  Gallery gallery = loader.load(faces.string());

  ASSERT_EQ(gallery.size(), 2u);
  EXPECT_EQ(gallery[0].label, "a");
  EXPECT_EQ(gallery[1].label, "c");

  ASSERT_EQ(gallery[0].encoding.size(), 3u);
  EXPECT_FLOAT_EQ(gallery[0].encoding[0], 10.0f);
  EXPECT_FLOAT_EQ(gallery[0].encoding[2], 30.0f);
  EXPECT_GT(cosine_similarity(gallery[1].encoding, {200.0f, 100.0f, 50.0f}),
            0.99f);

  // Only a.png and c.jpg decoded successfully
  EXPECT_EQ(encoder.encode_calls, 2);
}

TEST_F(GalleryTest, SkipsImagesWithoutFace) {
  fs::path faces = root / "faces";
  writeImage(faces / "blank.png", solidImage(0, 0, 0));
  writeImage(faces / "bob.png", solidImage(5, 6, 7));

  GalleryLoader loader(encoder);
  Gallery gallery = loader.load(faces.string());

  ASSERT_EQ(gallery.size(), 1u);
  EXPECT_EQ(gallery[0].label, "bob");
}

TEST_F(GalleryTest, ExtensionsAreCaseInsensitive) {
  fs::path faces = root / "faces";
  fs::create_directories(faces);
  writeImage(root / "x.png", solidImage(1, 2, 3));
  fs::rename(root / "x.png", faces / "Upper.PNG");
  writeImage(root / "y.jpg", solidImage(4, 5, 6));
  fs::rename(root / "y.jpg", faces / "mixed.JpEg");

  EXPECT_TRUE(GalleryLoader::isGalleryImage("photo.JPG"));
  EXPECT_FALSE(GalleryLoader::isGalleryImage("photo.gif"));
  EXPECT_FALSE(GalleryLoader::isGalleryImage("png"));

  GalleryLoader loader(encoder);
  Gallery gallery = loader.load(faces.string());

  ASSERT_EQ(gallery.size(), 2u);
  EXPECT_EQ(gallery[0].label, "Upper");
  EXPECT_EQ(gallery[1].label, "mixed");
}

TEST_F(GalleryTest, DuplicateLabelsAreKept) {
  fs::path faces = root / "faces";
  writeImage(faces / "alice.jpg", solidImage(10, 10, 200));
  writeImage(faces / "alice.png", solidImage(10, 200, 10));

  GalleryLoader loader(encoder);
  Gallery gallery = loader.load(faces.string());

  ASSERT_EQ(gallery.size(), 2u);
  EXPECT_EQ(gallery[0].label, "alice");
  EXPECT_EQ(gallery[1].label, "alice");
  EXPECT_NE(gallery[0].source_path, gallery[1].source_path);
}

TEST_F(GalleryTest, MissingDirectoryIsEmpty) {
  GalleryLoader loader(encoder);
  EXPECT_TRUE(loader.load((root / "nope").string()).empty());
}

TEST_F(GalleryTest, UnavailableEncoderIsEmpty) {
  fs::path faces = root / "faces";
  writeImage(faces / "a.png", solidImage(10, 20, 30));

  UnavailableEncoder unavailable("disabled");
  GalleryLoader loader(unavailable);
  EXPECT_TRUE(loader.load(faces.string()).empty());
}

TEST_F(GalleryTest, EncodesInEncoderChannelOrder) {
  fs::path faces = root / "faces";
  writeImage(faces / "a.png", solidImage(10, 20, 200));
  encoder.order = ChannelOrder::RGB;

  GalleryLoader loader(encoder);
  Gallery gallery = loader.load(faces.string());

  ASSERT_EQ(gallery.size(), 1u);
  ASSERT_EQ(gallery[0].encoding.size(), 3u);
  // R first once converted
  EXPECT_FLOAT_EQ(gallery[0].encoding[0], 200.0f);
  EXPECT_FLOAT_EQ(gallery[0].encoding[2], 10.0f);
}
