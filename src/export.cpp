#include "export.hpp"

#include <png.h>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

// Red channel of every pixel, row-major. 0xAABBGGRR -> RR.
static std::vector<uint8_t> gray_plane(const PixelBuffer& buf)
{
    std::vector<uint8_t> gray(buf.pixels.size());
    for (std::size_t i = 0; i < buf.pixels.size(); ++i)
        gray[i] = static_cast<uint8_t>(buf.pixels[i] & 0xFFu);
    return gray;
}

// ---------------------------------------------------------------------------
// PNG export (8-bit grayscale)
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Nothing to export: empty image";

    const std::vector<uint8_t> gray = gray_plane(buf);

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_GRAY,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y)
        png_write_row(png, gray.data() + static_cast<std::size_t>(y) * buf.width);

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless grayscale, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Nothing to export: empty image";

    const std::vector<uint8_t> gray = gray_plane(buf);

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                    = static_cast<uint32_t>(buf.width);
    bi.ysize                    = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample          = 8;
    bi.exponent_bits_per_sample = 0;
    bi.num_color_channels       = 1;
    bi.uses_original_profile    = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_TRUE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {1, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, gray.data(), gray.size())
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    std::vector<uint8_t> output(65536);
    uint8_t*    next_out  = output.data();
    std::size_t avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const std::size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<std::size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const std::size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return std::string("Short write: ") + path;
    return {};  // success
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------
// Raw depth plane (.npy version 1.0)
// ---------------------------------------------------------------------------
std::string export_depth_npy(const char* path, const DepthField& field)
{
    if (field.width <= 0 || field.height <= 0)
        return "Nothing to export: empty depth field";

    const uint16_t byte_order_mark = 1;
    uint8_t        first_byte      = 0;
    std::memcpy(&first_byte, &byte_order_mark, 1);
    const char* descr = first_byte == 1 ? "<f8" : ">f8";

    std::string header = std::string("{'descr': '") + descr +
                         "', 'fortran_order': False, 'shape': (" +
                         std::to_string(field.height) + ", " +
                         std::to_string(field.width) + "), }";
    // magic (6) + version (2) + header length (2) + header, padded with
    // spaces and a newline to a multiple of 64
    const std::size_t preamble = 10;
    const std::size_t unpadded = preamble + header.size() + 1;
    header.append((64 - unpadded % 64) % 64, ' ');
    header.push_back('\n');

    const uint16_t hlen       = static_cast<uint16_t>(header.size());
    const uint8_t  prefix[10] = {0x93, 'N', 'U', 'M', 'P', 'Y', 1, 0,
                                 static_cast<uint8_t>(hlen & 0xFFu),
                                 static_cast<uint8_t>(hlen >> 8)};

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    bool ok = std::fwrite(prefix, 1, sizeof(prefix), fp) == sizeof(prefix);
    ok = ok && std::fwrite(header.data(), 1, header.size(), fp) == header.size();
    ok = ok && std::fwrite(field.values.data(), sizeof(double), field.values.size(), fp)
                   == field.values.size();
    const bool closed = std::fclose(fp) == 0;
    if (!ok || !closed)
        return std::string("Short write: ") + path;
    return {};  // success
}

std::string export_image(const char* path, const PixelBuffer& buf, const std::string& filetype)
{
    if (filetype == "png")
        return export_png(path, buf);
#ifdef HAVE_JXL
    if (filetype == "jxl")
        return export_jxl(path, buf);
#endif
    return "Unsupported image type '" + filetype + "'"
         + (jxl_available() ? "" : " (built without JPEG XL support)");
}
