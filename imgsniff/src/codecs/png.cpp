#include "config.hpp"
#include "imgsniff/exception.hpp"
#include "imgsniff/utils/cast.hpp"
#include "probe-context.hpp"

#include <utility>

#include <png.h>

using namespace imgsniff;





namespace {
  struct png_guard {
    png_structp ptr {nullptr};
    png_infop   info{nullptr};



    png_guard(const png_guard&) = delete;
    png_guard& operator=(const png_guard&) = delete;



    png_guard(png_guard&& rhs) noexcept :
      ptr {std::exchange(rhs.ptr,  nullptr)},
      info{std::exchange(rhs.info, nullptr)}
    {}



    png_guard& operator=(png_guard&& rhs) noexcept {
      cleanup();
      ptr  = std::exchange(rhs.ptr,  nullptr);
      info = std::exchange(rhs.info, nullptr);

      return *this;
    }



    ~png_guard() {
      cleanup();
    }



    png_guard() :
      ptr{png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr)}
    {
      if (ptr == nullptr) {
        throw decode_error{codec::png, "unable to create png read struct"};
      }

      info = png_create_info_struct(ptr);
      if (info == nullptr) {
        png_destroy_read_struct(&ptr, nullptr, nullptr);
        throw decode_error{codec::png, "unable to create png info struct"};
      }
    }




    private:
      void cleanup() {
        if (ptr != nullptr) {
          if (info != nullptr) {
            png_destroy_read_struct(&ptr, &info, nullptr);
          } else {
            png_destroy_read_struct(&ptr, nullptr, nullptr);
          }
        }
      }
  };





  constexpr size_t png_signature_size{8};



  // Reads signature and chunks up to the first IDAT; no pixel data is touched.
  class png_probe {
    public:
      explicit png_probe(details::probe_context& ctx) :
        ctx_{&ctx}
      {
        png_set_error_fn(png.ptr, this, &error_function, &warn_function);
        png_set_read_fn (png.ptr, this, &read);
      }



      void run() {
        auto head = ctx_->data();

        if (head.size() < png_signature_size || png_sig_cmp(
              utils::byte_pointer_cast<const png_byte>(head.data()),
              0, png_signature_size) != 0) {
          throw decode_error{codec::png, "invalid signature"};
        }

        png_read_info(png.ptr, png.info);

        if (png_get_image_width(png.ptr, png.info) == 0
            || png_get_image_height(png.ptr, png.info) == 0) {
          throw decode_error{codec::png, "empty image header"};
        }
      }



    private:
      details::probe_context* ctx_;
      png_guard               png;



      static void read(png_structp png_ptr, png_bytep data, size_t length) {
        auto* self = static_cast<png_probe*>(png_get_io_ptr(png_ptr));

        if (self->ctx_->read(
              std::as_writable_bytes(std::span{data, length})) != length) {
          throw decode_error{codec::png, "failed to read: unexpected eof"};
        }
      }



      [[noreturn]] static void error_function(png_structp /*png*/, png_const_charp msg) {
        throw decode_error{codec::png, msg};
      }



      static void warn_function(png_structp png_ptr, png_const_charp msg) {
        auto* self = static_cast<png_probe*>(png_get_error_ptr(png_ptr));

        self->ctx_->warn(std::string{"png: "} + msg);
      }
  };
}





void probe_png(details::probe_context& ctx) {
  png_probe probe{ctx};
  probe.run();
}
