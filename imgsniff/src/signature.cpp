#include "imgsniff/magic.hpp"
#include "imgsniff/signature.hpp"

using namespace imgsniff;



bool signature::matches(std::span<const std::byte> input) const {
  if (bytes.empty()) {
    return false;
  }
  return check_magic(input, bytes, offset);
}





std::vector<signature> imgsniff::default_signatures() {
  return {
    {"jpeg", magic<codec::jpeg>::bytes},
    {"png",  magic<codec::png>::bytes},
    {"gif",  magic<codec::gif>::bytes_87},
    {"gif",  magic<codec::gif>::bytes_89},
    {"bmp",  magic<codec::bmp>::bytes},
    {"tiff", magic<codec::tiff>::bytes_le},
    {"tiff", magic<codec::tiff>::bytes_be},
  };
}



std::optional<std::string> imgsniff::match_signature(
    std::span<const std::byte> input,
    std::span<const signature> table
) {
  for (const auto& sig: table) {
    if (sig.matches(input)) {
      return sig.format;
    }
  }
  return {};
}
