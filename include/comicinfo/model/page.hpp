#pragma once

#include <comicinfo/model/enums.hpp>

#include <optional>
#include <string>
#include <utility>

namespace comicinfo {

// Sentinel for ImageWidth/ImageHeight when the producer did not record it.
constexpr int kUnknownDimension = -1;

struct PageDimensions {
    std::optional<int> width;
    std::optional<int> height;
};

// ---------------------------------------------------------------------------
// Page — metadata for one page image of an issue (a <Page> element).
//
// Immutable value. `image` is the 0-based image index and is required; all
// other members default to the schema defaults.
// ---------------------------------------------------------------------------
class Page {
public:
    explicit Page(int image,
                  PageType type = PageType::Story,
                  bool double_page = false,
                  long long image_size = 0,
                  std::string key = "",
                  std::string bookmark = "",
                  int image_width = kUnknownDimension,
                  int image_height = kUnknownDimension)
        : image_(image),
          type_(type),
          double_page_(double_page),
          image_size_(image_size),
          key_(std::move(key)),
          bookmark_(std::move(bookmark)),
          image_width_(image_width),
          image_height_(image_height) {}

    [[nodiscard]] int Image() const noexcept { return image_; }
    [[nodiscard]] PageType Type() const noexcept { return type_; }
    [[nodiscard]] bool DoublePage() const noexcept { return double_page_; }
    [[nodiscard]] long long ImageSize() const noexcept { return image_size_; }
    [[nodiscard]] const std::string& Key() const noexcept { return key_; }
    [[nodiscard]] const std::string& Bookmark() const noexcept { return bookmark_; }
    [[nodiscard]] int ImageWidth() const noexcept { return image_width_; }
    [[nodiscard]] int ImageHeight() const noexcept { return image_height_; }

    [[nodiscard]] bool IsCover() const noexcept { return comicinfo::IsCover(type_); }
    [[nodiscard]] bool IsStory() const noexcept { return comicinfo::IsStory(type_); }
    [[nodiscard]] bool IsDeleted() const noexcept { return comicinfo::IsDeleted(type_); }
    [[nodiscard]] bool IsDoublePage() const noexcept { return double_page_; }

    /// Non-empty bookmark text, no trimming.
    [[nodiscard]] bool IsBookmarked() const noexcept { return !bookmark_.empty(); }

    [[nodiscard]] bool DimensionsAvailable() const noexcept;

    /// Width and height with the -1 sentinel mapped to nullopt.
    [[nodiscard]] PageDimensions Dimensions() const;

    /// width / height; nullopt unless both are known and height is non-zero.
    [[nodiscard]] std::optional<double> AspectRatio() const;

    bool operator==(const Page& other) const;
    bool operator!=(const Page& other) const { return !(*this == other); }

private:
    int image_;
    PageType type_;
    bool double_page_;
    long long image_size_;
    std::string key_;
    std::string bookmark_;
    int image_width_;
    int image_height_;
};

} // namespace comicinfo
