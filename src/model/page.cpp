#include <comicinfo/model/page.hpp>

namespace comicinfo {

bool Page::DimensionsAvailable() const noexcept {
    return image_width_ != kUnknownDimension && image_height_ != kUnknownDimension;
}

PageDimensions Page::Dimensions() const {
    PageDimensions dims;
    if (image_width_ != kUnknownDimension) {
        dims.width = image_width_;
    }
    if (image_height_ != kUnknownDimension) {
        dims.height = image_height_;
    }
    return dims;
}

std::optional<double> Page::AspectRatio() const {
    if (!DimensionsAvailable() || image_height_ == 0) {
        return std::nullopt;
    }
    return static_cast<double>(image_width_) / static_cast<double>(image_height_);
}

bool Page::operator==(const Page& other) const {
    return image_ == other.image_ &&
           type_ == other.type_ &&
           double_page_ == other.double_page_ &&
           image_size_ == other.image_size_ &&
           key_ == other.key_ &&
           bookmark_ == other.bookmark_ &&
           image_width_ == other.image_width_ &&
           image_height_ == other.image_height_;
}

} // namespace comicinfo
