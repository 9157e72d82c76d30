#include "config.hpp"
#include "imgsniff/exception.hpp"
#include "imgsniff/probe.hpp"
#include "probe-context.hpp"

#include <algorithm>
#include <iterator>
#include <string>

using namespace imgsniff;



#ifdef IMGSNIFF_WITH_JPEG
void probe_jpeg(details::probe_context&);
#endif
#ifdef IMGSNIFF_WITH_PNG
void probe_png(details::probe_context&);
#endif
#ifdef IMGSNIFF_WITH_GIF
void probe_gif(details::probe_context&);
#endif
#ifdef IMGSNIFF_WITH_WEBP
void probe_webp(details::probe_context&);
#endif



namespace {
  // returns normally iff the library accepted the input as codec c
  void dispatch(codec c, details::probe_context& ctx) {
    switch (c) {
#ifdef IMGSNIFF_WITH_JPEG
      case codec::jpeg: probe_jpeg(ctx); return;
#endif
#ifdef IMGSNIFF_WITH_PNG
      case codec::png:  probe_png(ctx);  return;
#endif
#ifdef IMGSNIFF_WITH_GIF
      case codec::gif:  probe_gif(ctx);  return;
#endif
#ifdef IMGSNIFF_WITH_WEBP
      case codec::webp: probe_webp(ctx); return;
#endif
      default: break;
    }
    throw decode_error{c, "no decoder in this build"};
  }



  void run_decoder(codec c, details::probe_context& ctx) {
    try {
      dispatch(c, ctx);
    } catch (const base_exception&) {
      throw;
    } catch (const std::exception& ex) {
      throw decode_error{c, std::string{"fatal error: "} + ex.what()};
    }
  }



  [[nodiscard]] bool has_decoder(codec c) {
    auto list = list_decoder_codecs();
    return std::ranges::find(list, c) != list.end();
  }
}





library_probe::library_probe() :
  codecs_{list_decoder_codecs()}
{}



library_probe::library_probe(std::vector<codec> list) {
  for (auto c: list) {
    if (has_decoder(c) && std::ranges::find(codecs_, c) == codecs_.end()) {
      codecs_.push_back(c);
    }
  }
}



bool library_probe::available() const {
  return !codecs_.empty();
}



probe_result library_probe::probe(std::span<const std::byte> input) const {
  probe_result result;

  for (auto c: codecs_) {
    details::probe_context ctx{input};

    try {
      run_decoder(c, ctx);
    } catch (const base_exception& ex) {
      std::ranges::move(ctx.take_warnings(), std::back_inserter(result.warnings));
      result.warnings.emplace_back(ex.summary());
      continue;
    }

    std::ranges::move(ctx.take_warnings(), std::back_inserter(result.warnings));
    result.format = to_string(c);
    return result;
  }

  return result;
}





const format_probe& imgsniff::default_probe() {
#ifdef IMGSNIFF_WITH_DECODERS
  static const library_probe probe{};
#else
  static const null_probe probe{};
#endif
  return probe;
}
