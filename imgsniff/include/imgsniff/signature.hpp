// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_SIGNATURE_HPP_INCLUDED
#define IMGSNIFF_SIGNATURE_HPP_INCLUDED

#include "imgsniff/codecs.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>



namespace imgsniff {

struct signature {
  std::string            format;
  std::vector<std::byte> bytes;
  size_t                 offset{0};



  signature() = default;

  signature(std::string fmt, std::span<const std::byte> prefix, size_t off = 0) :
    format{std::move(fmt)},
    bytes (prefix.begin(), prefix.end()),
    offset{off}
  {}

  // prefix given as text, e.g. {"bmp", "BM"}
  signature(std::string fmt, std::string_view prefix, size_t off = 0) :
    signature{std::move(fmt), std::as_bytes(std::span{prefix}), off}
  {}



  [[nodiscard]] bool matches(std::span<const std::byte>) const;

  // bytes of input needed to decide this signature
  [[nodiscard]] size_t extent() const { return offset + bytes.size(); }
};



// jpeg, png, gif (87a, 89a), bmp, tiff (II, MM); checked in this order
[[nodiscard]] std::vector<signature> default_signatures();

// format of the first matching entry
[[nodiscard]] std::optional<std::string> match_signature(
    std::span<const std::byte>,
    std::span<const signature>
);

}

#endif // IMGSNIFF_SIGNATURE_HPP_INCLUDED
