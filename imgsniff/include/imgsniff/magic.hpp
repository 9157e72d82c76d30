// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_MAGIC_HPP_INCLUDED
#define IMGSNIFF_MAGIC_HPP_INCLUDED

#include "imgsniff/codecs.hpp"

#include <algorithm>
#include <array>
#include <span>



namespace imgsniff {

[[nodiscard]] constexpr bool check_magic(
    std::span<const std::byte> magic,
    std::span<const std::byte> proto
) {
  return magic.size() >= proto.size()
    && std::ranges::equal(magic.subspan(0, proto.size()), proto);
}



[[nodiscard]] constexpr bool check_magic(
    std::span<const std::byte> magic,
    std::span<const std::byte> proto,
    size_t                     offset
) {
  return offset <= magic.size() && proto.size() <= magic.size() - offset
    && std::ranges::equal(magic.subspan(offset, proto.size()), proto);
}





// Built-in signatures, one specialization per codec with a fixed prefix.
// The webp codec is only ever reported by its decoder.
template<codec C>
struct magic;



template<>
struct magic<codec::jpeg> {
  static constexpr std::array<std::byte, 2> bytes {
    std::byte{0xff}, std::byte{0xd8}
  };

  static constexpr size_t recommended_size{bytes.size()};
};



template<>
struct magic<codec::png> {
  static constexpr std::array<std::byte, 8> bytes = {
    std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47},
    std::byte{0x0d}, std::byte{0x0a}, std::byte{0x1a}, std::byte{0x0a}
  };

  static constexpr size_t recommended_size{bytes.size()};
};



template<>
struct magic<codec::gif> {
  static constexpr size_t recommended_size{6};

  static constexpr std::array<std::byte, 6> bytes_87 = {
    std::byte{0x47}, std::byte{0x49}, std::byte{0x46},
    std::byte{0x38}, std::byte{0x37}, std::byte{0x61},
  };

  static constexpr std::array<std::byte, 6> bytes_89 = {
    std::byte{0x47}, std::byte{0x49}, std::byte{0x46},
    std::byte{0x38}, std::byte{0x39}, std::byte{0x61},
  };
};



template<>
struct magic<codec::bmp> {
  static constexpr std::array<std::byte, 2> bytes = {
    std::byte{0x42}, std::byte{0x4d}
  };

  static constexpr size_t recommended_size{bytes.size()};
};



template<>
struct magic<codec::tiff> {
  static constexpr size_t recommended_size{2};

  // byte order mark only, the version word is not inspected
  static constexpr std::array<std::byte, 2> bytes_le = {
    std::byte{0x49}, std::byte{0x49}
  };

  static constexpr std::array<std::byte, 2> bytes_be = {
    std::byte{0x4d}, std::byte{0x4d}
  };
};





static constexpr size_t recommended_magic_size = std::max<size_t>({
  magic<codec::jpeg>::recommended_size,
  magic<codec::png>::recommended_size,
  magic<codec::gif>::recommended_size,
  magic<codec::bmp>::recommended_size,
  magic<codec::tiff>::recommended_size,
});



// number of leading bytes read from a file or taken from a buffer
static constexpr size_t default_header_size{32};

static_assert(default_header_size >= recommended_magic_size);

}

#endif // IMGSNIFF_MAGIC_HPP_INCLUDED
