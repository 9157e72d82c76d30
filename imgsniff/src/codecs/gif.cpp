#include "config.hpp"
#include "imgsniff/exception.hpp"
#include "imgsniff/details/hermit.hpp"
#include "probe-context.hpp"

#include <source_location>
#include <string>

#include <gif_lib.h>

using namespace imgsniff;



namespace {
  [[nodiscard]] std::string get_error_message(int error) {
    const char* msg{GifErrorString(error)};
    if (msg != nullptr) {
      return msg;
    }
    return "unknown error: " + std::to_string(error);
  }



  void gif_assert(
      int                         error,
      const std::string&          msg,
      const std::source_location& location = std::source_location::current()
  ) {
    if (error != D_GIF_SUCCEEDED) {
      throw decode_error{codec::gif, msg + ": " + get_error_message(error), location};
    }
  }



  [[nodiscard]] constexpr size_t saturating_cast(int v) {
    return v < 0 ? 0 : v;
  }



  // DGifOpen consumes the signature, the logical screen descriptor and the
  // global color table, if any.
  class gif_file : details::hermit {
    public:
      ~gif_file() {
        int error{D_GIF_SUCCEEDED};
        if (DGifCloseFile(gif_, &error) != GIF_OK) {
          ctx_->warn("gif: unable to close gif file: " + get_error_message(error));
        }
      }



      explicit gif_file(details::probe_context& ctx) :
        ctx_{&ctx}
      {
        int error{D_GIF_SUCCEEDED};
        gif_ = DGifOpen(this, &read, &error);
        gif_assert(error, "unable to open gif file");

        if (gif_ == nullptr) {
          throw decode_error{codec::gif, "unable to open gif file"};
        }
      }



      const GifFileType* operator->() const { return gif_; }



    private:
      details::probe_context* ctx_;
      GifFileType*            gif_;



      [[nodiscard]] static int read(GifFileType* file, GifByteType* data, int count) {
        auto* self = static_cast<gif_file*>(file->UserData);

        return static_cast<int>(self->ctx_->read(
            std::as_writable_bytes(std::span{data, saturating_cast(count)})));
      }
  };
}





void probe_gif(details::probe_context& ctx) {
  gif_file gif{ctx};

  if (gif->SWidth <= 0 || gif->SHeight <= 0) {
    ctx.warn("gif: empty logical screen");
  }
}
