//
// Created by Giuseppe Francione on 08/12/25.
//

#include <gtest/gtest.h>
#include "errors.hpp"
#include "png_processor.hpp"
#include "test_helpers.hpp"
#include <zlib.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pixtrim;

class PngProcessorTest : public ::testing::Test {
protected:
    PngProcessor processor;
    RunConfig config;

    // gAMA 1/2.2 plus an RGB iCCP profile, both right after IHDR
    static Bytes with_colour_chunks(const Bytes& png) {
        const std::vector<std::uint8_t> gama{0x00, 0x00, 0xB1, 0x8F};

        const auto profile = test::make_icc_profile("RGB ");
        uLongf packed_size = compressBound(static_cast<uLong>(profile.size()));
        std::vector<std::uint8_t> packed(packed_size);
        if (compress2(packed.data(), &packed_size, profile.data(), static_cast<uLong>(profile.size()), 9) != Z_OK) {
            throw std::runtime_error("compress2 failed");
        }
        packed.resize(packed_size);
        std::vector<std::uint8_t> iccp{'I', 'C', 'C', 0, 0};
        iccp.insert(iccp.end(), packed.begin(), packed.end());

        return test::png_insert_chunk(test::png_insert_chunk(png, "gAMA", gama), "iCCP", iccp);
    }

    static bool has_chunk(const Bytes& png, const std::string& type) {
        const auto types = test::png_chunk_types(png);
        return std::ranges::find(types, type) != types.end();
    }

    void SetUp() override {
        config.input_root = "unused";
        config.png_zopfli = ZopfliPolicy::Never;
    }
};

TEST_F(PngProcessorTest, UncompressedInputShrinksAndPixelsSurvive) {
    const RasterImage source = test::make_gradient(64, 64, 4);
    const auto input = PngProcessor::encode(source, 0);

    const auto output = processor.optimize(input, config);
    EXPECT_LT(output.size(), input.size());

    const RasterImage decoded = PngProcessor::decode(output);
    ASSERT_EQ(decoded.width, source.width);
    ASSERT_EQ(decoded.height, source.height);
    EXPECT_EQ(decoded.pixels, PngProcessor::decode(input).pixels);
}

TEST_F(PngProcessorTest, FewColoursStillDecodeIdentically) {
    RasterImage source;
    source.width = 32;
    source.height = 32;
    source.channels = 3;
    source.pixels.resize(source.row_bytes() * source.height);
    for (std::size_t i = 0; i < source.pixels.size(); i += 3) {
        const bool dark = (i / 3) % 7 < 3;
        source.pixels[i] = dark ? 10 : 240;
        source.pixels[i + 1] = dark ? 20 : 200;
        source.pixels[i + 2] = 30;
    }
    const auto input = PngProcessor::encode(source, 0);

    const auto output = processor.optimize(input, config);
    EXPECT_LT(output.size(), input.size());
    EXPECT_EQ(PngProcessor::decode(output).pixels, PngProcessor::decode(input).pixels);
}

TEST_F(PngProcessorTest, ZopfliNeverBeatsZlibResultByGrowing) {
    const auto input = PngProcessor::encode(test::make_gradient(32, 32, 3), 0);
    const auto zlib_only = processor.optimize(input, config);

    config.png_zopfli = ZopfliPolicy::Always;
    config.zopfli_iterations = 1;
    const auto with_zopfli = processor.optimize(input, config);
    EXPECT_LE(with_zopfli.size(), zlib_only.size());
    EXPECT_EQ(PngProcessor::decode(with_zopfli).pixels, PngProcessor::decode(input).pixels);
}

TEST_F(PngProcessorTest, MaxEdgeDownscales) {
    const auto input = PngProcessor::encode(test::make_gradient(100, 40, 3));
    config.max_edge_px = 25;

    const RasterImage decoded = PngProcessor::decode(processor.optimize(input, config));
    EXPECT_EQ(decoded.width, 25u);
    EXPECT_EQ(decoded.height, 10u);
}

TEST_F(PngProcessorTest, TruncatedInputIsDecodeError) {
    auto input = PngProcessor::encode(test::make_gradient(16, 16, 3));
    input.resize(input.size() / 2);
    try {
        (void) processor.optimize(input, config);
        FAIL() << "expected DecodeError";
    } catch (const FileError& e) {
        EXPECT_EQ(e.kind(), FileErrorKind::DecodeError);
    }
}

TEST_F(PngProcessorTest, ColourChunksSurviveWithDefaultSettings) {
    const Bytes input = with_colour_chunks(PngProcessor::encode(test::make_gradient(64, 64, 3), 0));
    ASSERT_TRUE(has_chunk(input, "gAMA"));
    ASSERT_TRUE(has_chunk(input, "iCCP"));

    RunConfig defaults;
    defaults.input_root = "unused";
    ASSERT_FALSE(defaults.preserve_metadata);

    const auto output = processor.optimize(input, defaults);
    EXPECT_LT(output.size(), input.size());
    EXPECT_TRUE(has_chunk(output, "gAMA"));
    EXPECT_TRUE(has_chunk(output, "iCCP"));
}

TEST_F(PngProcessorTest, ZopfliPassKeepsColourChunksWithoutMetadataFlag) {
    const Bytes input = with_colour_chunks(PngProcessor::encode(test::make_gradient(32, 32, 3), 6));

    const auto output = PngProcessor::zopfli_pass(input, 1, false);
    EXPECT_TRUE(has_chunk(output, "gAMA"));
    EXPECT_TRUE(has_chunk(output, "iCCP"));
}

TEST_F(PngProcessorTest, RgbProfileKeepsGrayPixelsInColourType) {
    RasterImage gray = test::make_gradient(48, 48, 1);
    RasterImage rgb;
    rgb.width = gray.width;
    rgb.height = gray.height;
    rgb.channels = 3;
    for (const auto v : gray.pixels) {
        rgb.pixels.insert(rgb.pixels.end(), {v, v, v});
    }
    const Bytes input = with_colour_chunks(PngProcessor::encode(rgb, 0));

    const auto output = processor.optimize(input, config);
    ASSERT_TRUE(has_chunk(output, "iCCP"));
    // IHDR colour type byte: 2 (RGB) or 3 (palette), never 0 (gray)
    ASSERT_GT(output.size(), 25u);
    EXPECT_NE(output[25], 0);
    EXPECT_EQ(PngProcessor::decode(output).pixels, PngProcessor::decode(input).pixels);
}
