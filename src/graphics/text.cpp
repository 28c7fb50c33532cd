#include "fine2d/graphics/text.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cmath>

namespace fine2d {

namespace {

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

void checkFreeType(FT_Error error, const std::string& what) {
    if (error != 0) {
        throw ResourceLoadError(what + " (FreeType error " + std::to_string(error) + ")");
    }
}

} // namespace

std::vector<char32_t> decodeUtf8(const std::string& text) {
    std::vector<char32_t> codePoints;
    codePoints.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            length = 1;
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        } else {
            codePoints.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            codePoints.push_back(REPLACEMENT_CHARACTER);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                length = k;
                break;
            }
            cp = (cp << 6) | (next & 0x3F);
        }
        codePoints.push_back(valid ? cp : REPLACEMENT_CHARACTER);
        i += length;
    }
    return codePoints;
}

// ============================================================================
// Font
// ============================================================================

struct Font::Face {
    FT_Library library = nullptr;
    FT_Face face = nullptr;
    std::vector<uint8_t> data;  // FreeType reads from this for the life of the face
    float pixelHeight = 0.0f;

    ~Face() {
        if (face) {
            FT_Done_Face(face);
        }
        if (library) {
            FT_Done_FreeType(library);
        }
    }
};

Font Font::fromBytes(std::vector<uint8_t> bytes, float pixelHeight) {
    if (!(pixelHeight > 0.0f)) {
        throw ResourceLoadError("Font pixel height must be positive");
    }
    if (bytes.empty()) {
        throw ResourceLoadError("Font data is empty");
    }

    auto face = std::make_shared<Face>();
    face->data = std::move(bytes);
    face->pixelHeight = pixelHeight;

    checkFreeType(FT_Init_FreeType(&face->library), "Failed to initialize FreeType");
    checkFreeType(FT_New_Memory_Face(face->library, face->data.data(),
                                     static_cast<FT_Long>(face->data.size()), 0, &face->face),
                  "Failed to parse font data");
    checkFreeType(FT_Set_Pixel_Sizes(face->face, 0, static_cast<FT_UInt>(std::lround(pixelHeight))),
                  "Font does not support pixel height " + std::to_string(pixelHeight));

    FINE2D_DEBUG(LogCategory::Resource, std::string("Font loaded: ") +
                 (face->face->family_name ? face->face->family_name : "unnamed") + " at " +
                 std::to_string(pixelHeight) + "px");
    return Font(std::move(face));
}

Font Font::load(GraphicsContext& ctx, const std::string& path, float pixelHeight) {
    return fromBytes(ctx.filesystem().open(path), pixelHeight);
}

float Font::pixelHeight() const {
    return face_->pixelHeight;
}

int Font::ascender() const {
    return static_cast<int>(face_->face->size->metrics.ascender >> 6);
}

int Font::lineHeight() const {
    const auto& metrics = face_->face->size->metrics;
    return static_cast<int>((metrics.ascender - metrics.descender) >> 6);
}

int Font::measure(const std::string& text) const {
    FT_Face face = face_->face;
    FT_UInt previous = 0;
    FT_Pos pen = 0;
    for (char32_t cp : decodeUtf8(text)) {
        FT_UInt glyph = FT_Get_Char_Index(face, cp);
        if (previous && glyph && FT_HAS_KERNING(face)) {
            FT_Vector delta;
            if (FT_Get_Kerning(face, previous, glyph, FT_KERNING_DEFAULT, &delta) == 0) {
                pen += delta.x;
            }
        }
        checkFreeType(FT_Load_Glyph(face, glyph, FT_LOAD_DEFAULT), "Failed to load glyph");
        pen += face->glyph->advance.x;
        previous = glyph;
    }
    return static_cast<int>(pen >> 6);
}

Font::Bitmap Font::rasterize(const std::string& text) const {
    FT_Face face = face_->face;
    int baseline = ascender();

    Bitmap bitmap;
    bitmap.width = static_cast<uint32_t>(std::max(1, measure(text)));
    bitmap.height = static_cast<uint32_t>(std::max(1, lineHeight()));
    bitmap.rgba.assign(static_cast<size_t>(bitmap.width) * bitmap.height * 4, 0);
    for (size_t i = 0; i < bitmap.rgba.size(); i += 4) {
        bitmap.rgba[i + 0] = 255;
        bitmap.rgba[i + 1] = 255;
        bitmap.rgba[i + 2] = 255;
    }

    FT_UInt previous = 0;
    FT_Pos pen = 0;
    for (char32_t cp : decodeUtf8(text)) {
        FT_UInt glyph = FT_Get_Char_Index(face, cp);
        if (previous && glyph && FT_HAS_KERNING(face)) {
            FT_Vector delta;
            if (FT_Get_Kerning(face, previous, glyph, FT_KERNING_DEFAULT, &delta) == 0) {
                pen += delta.x;
            }
        }
        checkFreeType(FT_Load_Glyph(face, glyph, FT_LOAD_RENDER), "Failed to render glyph");

        FT_GlyphSlot slot = face->glyph;
        const FT_Bitmap& src = slot->bitmap;
        int originX = static_cast<int>(pen >> 6) + slot->bitmap_left;
        int originY = baseline - slot->bitmap_top;

        if (src.pixel_mode == FT_PIXEL_MODE_GRAY) {
            for (unsigned row = 0; row < src.rows; ++row) {
                int y = originY + static_cast<int>(row);
                if (y < 0 || y >= static_cast<int>(bitmap.height)) {
                    continue;
                }
                const unsigned char* line = src.buffer + static_cast<std::ptrdiff_t>(row) * src.pitch;
                for (unsigned col = 0; col < src.width; ++col) {
                    int x = originX + static_cast<int>(col);
                    if (x < 0 || x >= static_cast<int>(bitmap.width)) {
                        continue;
                    }
                    uint8_t& alpha = bitmap.rgba[(static_cast<size_t>(y) * bitmap.width + x) * 4 + 3];
                    alpha = std::max(alpha, static_cast<uint8_t>(line[col]));
                }
            }
        } else if (src.rows > 0) {
            FINE2D_WARN(LogCategory::Resource, "Skipping glyph with unsupported pixel mode " +
                        std::to_string(src.pixel_mode));
        }

        pen += slot->advance.x;
        previous = glyph;
    }
    return bitmap;
}

// ============================================================================
// Text
// ============================================================================

Text::Text(std::string contents, Image image)
    : contents_(std::move(contents))
    , image_(std::move(image)) {
}

Text Text::create(GraphicsContext& ctx, std::string contents, const Font& font) {
    Font::Bitmap bitmap = font.rasterize(contents);
    Image image = Image::fromRgba8(ctx, bitmap.width, bitmap.height, bitmap.rgba);
    return Text(std::move(contents), std::move(image));
}

} // namespace fine2d
