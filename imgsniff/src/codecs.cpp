#include "imgsniff/codecs.hpp"
#include "imgsniff/magic.hpp"
#include "imgsniff/reader.hpp"
#include "imgsniff/signature.hpp"

#include <array>

using namespace imgsniff;



std::optional<codec> imgsniff::determine_codec(std::span<const std::byte> input) {
  static const auto table = default_signatures();

  auto name = match_signature(input, table);
  if (!name) {
    return {};
  }

  for (auto c: list_all_codecs()) {
    if (stringify(c) == *name) {
      return c;
    }
  }
  return {};
}



std::optional<codec> imgsniff::determine_codec(
  const std::filesystem::path& p
) {
  try {
    reader r{p};

    std::array<std::byte, recommended_magic_size> buffer{};
    size_t count = r.read(buffer);

    return determine_codec(std::span<const std::byte>{buffer.data(), count});
  } catch (const no_stream_access&) {
    return {};
  }
}





std::string_view imgsniff::stringify(codec c) {
  switch (c) {
    case codec::jpeg: return "jpeg";
    case codec::png:  return "png";
    case codec::gif:  return "gif";
    case codec::bmp:  return "bmp";
    case codec::tiff: return "tiff";
    case codec::webp: return "webp";
  }

  return "<invalid codec>";
}



std::vector<std::string_view> imgsniff::mime_types(codec c) {
  switch (c) {
    case codec::jpeg: return {"image/jpeg"};
    case codec::png:  return {"image/png"};
    case codec::gif:  return {"image/gif"};
    case codec::bmp:  return {"image/bmp", "image/x-ms-bmp"};
    case codec::tiff: return {"image/tiff"};
    case codec::webp: return {"image/webp"};
  }
  return {};
}
