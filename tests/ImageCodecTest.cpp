#include "Decoder.hpp"
#include "Encoder.hpp"
#include "ImageCodec.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <limits>
#include <opencv2/core.hpp>

#include "TestImages.hpp"

using namespace lsbkit;

TEST(ImageCodecTest, FormatFromPath) {
  EXPECT_EQ(*formatFromPath("out/steg.PNG"), ImageFormat::Png);
  EXPECT_EQ(*formatFromPath("a.jpeg"), ImageFormat::Jpeg);
  EXPECT_EQ(*formatFromPath("a.jpg"), ImageFormat::Jpeg);
  EXPECT_EQ(*formatFromPath("a.bmp"), ImageFormat::Bmp);
  EXPECT_EQ(formatFromPath("a.gif").error(), StegoError::UnsupportedFormat);
  EXPECT_EQ(formatFromPath("noext").error(), StegoError::UnsupportedFormat);
}

TEST(ImageCodecTest, RejectsGarbage) {
  EXPECT_EQ(loadImage({}).error(), StegoError::InvalidImage);
  const auto garbage = test::bytesOf("definitely not an image");
  EXPECT_EQ(loadImage(garbage).error(), StegoError::InvalidImage);
  EXPECT_EQ(decodeBytes(StegoConfig{}, garbage).error(),
            StegoError::InvalidImage);
  EXPECT_EQ(encodeBytes(garbage, StegoConfig{}, garbage).error(),
            StegoError::InvalidImage);
  EXPECT_EQ(loadImageFile("/nonexistent/cover.png").error(),
            StegoError::InvalidImage);
}

TEST(ImageCodecTest, DecodableSizeFitsOpenCvHeader) {
  EXPECT_FALSE(isDecodableSize(0));
  EXPECT_TRUE(isDecodableSize(1));
  EXPECT_TRUE(isDecodableSize(
      static_cast<std::size_t>(std::numeric_limits<int>::max())));
  EXPECT_FALSE(isDecodableSize(
      static_cast<std::size_t>(std::numeric_limits<int>::max()) + 1));
  EXPECT_FALSE(isDecodableSize(std::numeric_limits<std::size_t>::max()));
}

TEST(ImageCodecTest, PixelBufferCopiesOwnTheirPixels) {
  PixelBuffer first = test::patternImage(3, 3);
  const PixelBuffer second = first;
  first.setChannelByte(1, 1, Channel::Red, 0);
  first.setChannelByte(1, 1, Channel::Green, 0);
  EXPECT_NE(second.color(1, 1), first.color(1, 1));
  EXPECT_EQ(second.color(1, 1), test::patternImage(3, 3).color(1, 1));
}

TEST(ImageCodecTest, PixelBufferUsesRgbChannelOrder) {
  cv::Mat bgr(1, 1, CV_8UC3, cv::Scalar(10, 20, 30));
  auto buffer = PixelBuffer::fromMat(bgr);
  ASSERT_TRUE(buffer);
  EXPECT_EQ(buffer->getChannelByte(0, 0, Channel::Red), 30);
  EXPECT_EQ(buffer->getChannelByte(0, 0, Channel::Green), 20);
  EXPECT_EQ(buffer->getChannelByte(0, 0, Channel::Blue), 10);
  EXPECT_EQ(buffer->color(0, 0), (Rgb{30, 20, 10}));

  buffer->setChannelByte(0, 0, Channel::Red, 99);
  EXPECT_EQ(bgr.at<cv::Vec3b>(0, 0)[2], 30) << "fromMat must copy";
}

TEST(ImageCodecTest, PixelBufferConvertsGrayAndAlpha) {
  auto gray = PixelBuffer::fromMat(cv::Mat(2, 3, CV_8UC1, cv::Scalar(7)));
  ASSERT_TRUE(gray);
  EXPECT_EQ(gray->width(), 3);
  EXPECT_EQ(gray->height(), 2);
  EXPECT_EQ(gray->color(2, 1), (Rgb{7, 7, 7}));

  auto bgra =
      PixelBuffer::fromMat(cv::Mat(2, 2, CV_8UC4, cv::Scalar(1, 2, 3, 4)));
  ASSERT_TRUE(bgra);
  EXPECT_EQ(bgra->mat().channels(), 3);
  EXPECT_EQ(bgra->color(0, 0), (Rgb{3, 2, 1}));

  EXPECT_EQ(PixelBuffer::fromMat(cv::Mat()).error(), StegoError::InvalidImage);
  EXPECT_EQ(PixelBuffer::fromMat(cv::Mat(2, 2, CV_32FC3)).error(),
            StegoError::InvalidImage);
}

TEST(ImageCodecTest, LosslessFormatsPreserveEmbeddedData) {
  const auto message = test::bytesOf("carried through a container--");
  const auto encodeConfig = *StegoConfig::Builder()
                                 .bitsPerPixel(2)
                                 .channel(Channel::Green)
                                 .build();
  const auto decodeConfig = *StegoConfig::Builder()
                                 .bitsPerPixel(2)
                                 .channel(Channel::Green)
                                 .marker(std::string_view("--"))
                                 .build();

  auto encoded = encode(message, encodeConfig, test::patternImage(24, 24));
  ASSERT_TRUE(encoded);

  for (ImageFormat format : {ImageFormat::Png, ImageFormat::Bmp}) {
    auto bytes = encoded->write(format);
    ASSERT_TRUE(bytes) << formatExtension(format);

    auto decoded = decodeBytes(decodeConfig, *bytes);
    ASSERT_TRUE(decoded);
    EXPECT_TRUE(decoded->hitMarker());
    EXPECT_EQ(decoded->embeddedData(), message);
  }
}

TEST(ImageCodecTest, SaveAndLoadFile) {
  const auto dir = std::filesystem::temp_directory_path() / "lsbkit_codec_test";
  const auto path = dir / "steg.png";
  std::filesystem::remove_all(dir);

  const auto message = test::bytesOf("file round trip;");
  auto cover = encodeImage(test::patternImage(16, 16), ImageFormat::Png);
  ASSERT_TRUE(cover);

  auto encoded = encodeBytes(message, StegoConfig{}, *cover);
  ASSERT_TRUE(encoded);
  ASSERT_TRUE(encoded->save(path));

  auto decoded = decodeFile(
      *StegoConfig::Builder().marker(std::string_view(";")).build(), path);
  ASSERT_TRUE(decoded);
  EXPECT_TRUE(decoded->hitMarker());
  EXPECT_EQ(decoded->embeddedData(), message);

  auto reencoded = encodeFile(message, StegoConfig{}, path);
  ASSERT_TRUE(reencoded);
  EXPECT_EQ(reencoded->pixelsChanged(), 0u);

  EXPECT_EQ(encoded->save(dir / "steg.tiff").error(),
            StegoError::UnsupportedFormat);
  std::filesystem::remove_all(dir);
}

TEST(ImageCodecTest, JpegEncodes) {
  auto bytes = encodeImage(test::patternImage(8, 8), ImageFormat::Jpeg, 90);
  ASSERT_TRUE(bytes);
  ASSERT_GE(bytes->size(), 2u);
  EXPECT_EQ((*bytes)[0], 0xFF);
  EXPECT_EQ((*bytes)[1], 0xD8);

  EXPECT_EQ(encodeImage(PixelBuffer{}, ImageFormat::Png).error(),
            StegoError::WriteFailure);
}
