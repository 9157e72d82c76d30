// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_CODECS_HPP_INCLUDED
#define IMGSNIFF_CODECS_HPP_INCLUDED

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>



namespace imgsniff {

enum class codec {
  jpeg,
  png,
  gif,
  bmp,
  tiff,
  webp,
};

[[nodiscard]] std::string_view stringify(codec);

[[nodiscard]] inline std::string to_string(codec cc) {
  return std::string{stringify(cc)};
}



[[nodiscard]] std::vector<std::string_view> mime_types(codec);

inline std::vector<codec> list_all_codecs() {
  return {
    codec::jpeg,
    codec::png,
    codec::gif,
    codec::bmp,
    codec::tiff,
    codec::webp
  };
}



// codecs backed by an image library compiled into this build
inline std::vector<codec> list_decoder_codecs() {
  return {
#ifdef IMGSNIFF_WITH_JPEG
    codec::jpeg,
#endif
#ifdef IMGSNIFF_WITH_PNG
    codec::png,
#endif
#ifdef IMGSNIFF_WITH_GIF
    codec::gif,
#endif
#ifdef IMGSNIFF_WITH_WEBP
    codec::webp,
#endif
  };
}



std::optional<codec> determine_codec(std::span<const std::byte>);
std::optional<codec> determine_codec(const std::filesystem::path&);

}

#endif // IMGSNIFF_CODECS_HPP_INCLUDED
