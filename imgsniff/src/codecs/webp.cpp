#include "config.hpp"
#include "imgsniff/exception.hpp"
#include "imgsniff/utils/cast.hpp"
#include "probe-context.hpp"

#include <cstdint>
#include <string>

#include <webp/decode.h>

using namespace imgsniff;



namespace {
  [[nodiscard]] std::string status_message(VP8StatusCode status) {
    switch (status) {
      case VP8_STATUS_OK:                  return "ok";
      case VP8_STATUS_OUT_OF_MEMORY:       return "out of memory";
      case VP8_STATUS_INVALID_PARAM:       return "invalid parameter";
      case VP8_STATUS_BITSTREAM_ERROR:     return "bitstream error";
      case VP8_STATUS_UNSUPPORTED_FEATURE: return "unsupported feature";
      case VP8_STATUS_SUSPENDED:           return "suspended";
      case VP8_STATUS_USER_ABORT:          return "user abort";
      case VP8_STATUS_NOT_ENOUGH_DATA:     return "not enough data";
    }
    return "unknown status: " + std::to_string(static_cast<int>(status));
  }
}





// RIFF container and VP8/VP8L/VP8X chunk header only
void probe_webp(details::probe_context& ctx) {
  auto data = ctx.data();

  WebPBitstreamFeatures features{};
  auto status = WebPGetFeatures(
      utils::byte_pointer_cast<const uint8_t>(data.data()), data.size(), &features);

  if (status != VP8_STATUS_OK) {
    throw decode_error{codec::webp, status_message(status)};
  }

  if (features.width <= 0 || features.height <= 0) {
    throw decode_error{codec::webp, "empty image header"};
  }
}
