#include "common.hpp"

#include <cstdint>

#include <imgsniff/codecs.hpp>
#include <imgsniff/magic.hpp>
#include <imgsniff/signature.hpp>

using namespace imgsniff;
using namespace std::string_view_literals;



void test_default_table() {
  auto table = default_signatures();

  id_assert_eq(table.size(), 7u);

  std::vector<std::string> order;
  for (const auto& sig: table) {
    order.push_back(sig.format);
    id_assert_eq(sig.offset, 0u);
    id_assert(sig.extent() <= default_header_size);
  }

  id_assert(order == std::vector<std::string>{
      "jpeg", "png", "gif", "gif", "bmp", "tiff", "tiff"});

  id_assert(table[2].bytes == bytes("GIF87a"sv));
  id_assert(table[3].bytes == bytes("GIF89a"sv));
  id_assert(table[5].bytes == bytes("II"sv));
  id_assert(table[6].bytes == bytes("MM"sv));
}





void test_builtin_formats() {
  auto table = default_signatures();

  id_assert_eq(match_signature(bytes({0xff, 0xd8}), table), "jpeg");
  id_assert_eq(match_signature(bytes({0xff, 0xd8, 0xff, 0xe0, 0x00, 0x10}), table),
               "jpeg");

  id_assert_eq(match_signature(
        bytes({0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n', 0x00}), table), "png");

  id_assert_eq(match_signature(bytes("GIF87a"sv),         table), "gif");
  id_assert_eq(match_signature(bytes("GIF89a\x01\x00"sv), table), "gif");
  id_assert_eq(match_signature(bytes("BM6\x0c"sv),         table), "bmp");
  id_assert_eq(match_signature(bytes("II*\x00"sv),         table), "tiff");
  id_assert_eq(match_signature(bytes("MM\x00*"sv),         table), "tiff");
}



void test_near_misses() {
  auto table = default_signatures();

  id_assert(!match_signature({}, table));
  id_assert(!match_signature(bytes({0xff}), table));
  id_assert(!match_signature(bytes({0xd8, 0xff}), table));
  id_assert(!match_signature(bytes({0x89, 'P', 'N', 'G', '\r', '\n', 0x1a}), table),
      "truncated png signature");
  id_assert(!match_signature(bytes("GIF88a"sv), table));
  id_assert(!match_signature(bytes("GIF8"sv),   table));
  id_assert(!match_signature(bytes("bm"sv),     table));
  id_assert(!match_signature(bytes("IM"sv),     table));
  id_assert(!match_signature(bytes("not an image"sv), table));
}





void test_custom_table() {
  std::vector<signature> table{
    {"webp", "WEBP", 8},
    {"riff", "RIFF"},
  };

  auto webp = bytes("RIFF\x24\x00\x00\x00WEBPVP8 "sv);
  auto wave = bytes("RIFF\x24\x00\x00\x00WAVEfmt "sv);

  id_assert_eq(match_signature(webp, table), "webp", "first match wins");
  id_assert_eq(match_signature(wave, table), "riff");
  id_assert(!match_signature(bytes("RIF"sv), table));

  id_assert_eq(table[0].extent(), 12u);
  id_assert(!table[0].matches(bytes("RIFF\x24\x00\x00\x00WEB"sv)), "input too short");

  signature far{"x", "A", SIZE_MAX};
  id_assert(!far.matches(bytes("AB"sv)), "offset beyond the input never matches");
  id_assert(!match_signature(bytes("AB"sv), std::span{&far, 1}));

  signature edge{"x", "B", 1};
  id_assert(edge.matches(bytes("AB"sv)));
  id_assert(!signature{"x", "B", 2}.matches(bytes("AB"sv)));

  signature empty{};
  id_assert(!empty.matches(bytes("anything"sv)), "empty signature matches nothing");
}





void test_determine_codec() {
  id_assert_eq(determine_codec(bytes({0xff, 0xd8, 0xff})), codec::jpeg);
  id_assert_eq(determine_codec(bytes("GIF89a"sv)),  codec::gif);
  id_assert_eq(determine_codec(bytes("BM"sv)),      codec::bmp);
  id_assert_eq(determine_codec(bytes("MM\x00*"sv)), codec::tiff);
  id_assert(!determine_codec(bytes("RIFF\x24\x00\x00\x00WEBPVP8 "sv)),
      "webp is only reported by its decoder");
  id_assert(!determine_codec(std::span<const std::byte>{}));
}



void test_codec_names() {
  for (auto c: list_all_codecs()) {
    id_assert(!stringify(c).empty());
    id_assert(!mime_types(c).empty());
    id_assert_eq(to_string(c), std::string{stringify(c)});
  }

  id_assert_eq(stringify(codec::tiff), std::string_view{"tiff"});
  id_assert_eq(mime_types(codec::png).front(), std::string_view{"image/png"});

  for (auto c: list_decoder_codecs()) {
    id_assert(c != codec::bmp && c != codec::tiff, "no decoder for bmp or tiff");
  }
}





int main() {
  test_default_table();
  test_builtin_formats();
  test_near_misses();
  test_custom_table();
  test_determine_codec();
  test_codec_names();
}
