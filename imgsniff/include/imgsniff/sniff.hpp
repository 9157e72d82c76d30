// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_SNIFF_HPP_INCLUDED
#define IMGSNIFF_SNIFF_HPP_INCLUDED

#include "imgsniff/magic.hpp"
#include "imgsniff/probe.hpp"
#include "imgsniff/signature.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>



namespace imgsniff {

// nothing, a file to read the header from, or the bytes of an image
using source = std::variant<
  std::monostate,
  std::filesystem::path,
  std::span<const std::byte>
>;



enum class origin {
  none,
  decoder,
  signature,
};

[[nodiscard]] std::string_view stringify(origin);



struct sniff_options {
  size_t                 header_size {default_header_size};
  std::vector<signature> signatures  {default_signatures()};
  bool                   use_decoders{true};

  // nullptr selects default_probe()
  const format_probe*    probe       {nullptr};
};



struct sniff_report {
  std::optional<std::string> format;
  origin                     found_by{origin::none};
  std::vector<std::string>   warnings;
};



// Never throws for unreadable or unrecognized input. If a header is given,
// the source is not touched.
[[nodiscard]] sniff_report sniff(
    const source&                             input,
    std::optional<std::span<const std::byte>> header  = {},
    const sniff_options&                      options = {}
);

[[nodiscard]] std::optional<std::string> what(
    const source&                             input,
    std::optional<std::span<const std::byte>> header  = {},
    const sniff_options&                      options = {}
);

}

#endif // IMGSNIFF_SNIFF_HPP_INCLUDED
