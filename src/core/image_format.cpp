#include <peek/core/image_format.hpp>
#include <algorithm>
#include <initializer_list>
#include <cctype>
#include <string>

namespace peek::core {

namespace {

bool starts_with(std::span<const std::byte> bytes,
                 std::initializer_list<unsigned char> magic,
                 std::size_t offset = 0) {
  if (bytes.size() < offset + magic.size()) return false;
  std::size_t i = offset;
  for (unsigned char c : magic) {
    if (std::to_integer<unsigned char>(bytes[i++]) != c) return false;
  }
  return true;
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

ImageFormat sniff_format(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ImageFormat::Png;
  if (starts_with(bytes, {0xFF, 0xD8, 0xFF})) return ImageFormat::Jpeg;
  if (starts_with(bytes, {'G', 'I', 'F', '8'})) return ImageFormat::Gif;
  if (starts_with(bytes, {'B', 'M'})) return ImageFormat::Bmp;
  if (starts_with(bytes, {'R', 'I', 'F', 'F'}) && starts_with(bytes, {'W', 'E', 'B', 'P'}, 8)) {
    return ImageFormat::Webp;
  }
  return ImageFormat::Unknown;
}

ImageFormat format_from_content_type(std::string_view content_type) noexcept {
  // Drop parameters such as "; charset=binary".
  const auto semi = content_type.find(';');
  if (semi != std::string_view::npos) content_type = content_type.substr(0, semi);
  while (!content_type.empty() && content_type.back() == ' ') content_type.remove_suffix(1);

  const std::string ct = lower(content_type);
  if (ct == "image/png") return ImageFormat::Png;
  if (ct == "image/jpeg" || ct == "image/jpg") return ImageFormat::Jpeg;
  if (ct == "image/gif") return ImageFormat::Gif;
  if (ct == "image/bmp" || ct == "image/x-ms-bmp") return ImageFormat::Bmp;
  if (ct == "image/webp") return ImageFormat::Webp;
  return ImageFormat::Unknown;
}

ImageFormat format_from_extension(std::string_view ext) noexcept {
  if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
  const std::string e = lower(ext);
  if (e == "png") return ImageFormat::Png;
  if (e == "jpg" || e == "jpeg") return ImageFormat::Jpeg;
  if (e == "gif") return ImageFormat::Gif;
  if (e == "bmp") return ImageFormat::Bmp;
  if (e == "webp") return ImageFormat::Webp;
  return ImageFormat::Unknown;
}

std::string_view content_type_of(ImageFormat format) noexcept {
  switch (format) {
    case ImageFormat::Png:
      return "image/png";
    case ImageFormat::Jpeg:
      return "image/jpeg";
    case ImageFormat::Gif:
      return "image/gif";
    case ImageFormat::Bmp:
      return "image/bmp";
    case ImageFormat::Webp:
      return "image/webp";
    case ImageFormat::Unknown:
    default:
      return "application/octet-stream";
  }
}

std::string_view extension_of(ImageFormat format) noexcept {
  switch (format) {
    case ImageFormat::Png:
      return "png";
    case ImageFormat::Jpeg:
      return "jpg";
    case ImageFormat::Gif:
      return "gif";
    case ImageFormat::Bmp:
      return "bmp";
    case ImageFormat::Webp:
      return "webp";
    case ImageFormat::Unknown:
    default:
      return "bin";
  }
}

}  // namespace peek::core
