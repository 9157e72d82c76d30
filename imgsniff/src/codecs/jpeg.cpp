#include "config.hpp"
#include "imgsniff/exception.hpp"
#include "imgsniff/details/hermit.hpp"
#include "imgsniff/utils/cast.hpp"
#include "probe-context.hpp"

#include <cstdio>
#include <memory>
#include <string>

#include <jpeglib.h>

using namespace imgsniff;



namespace {
  // Derived from the implementation of jpeg_mem_src in libjpeg-turbo, but
  // running out of data is an error instead of a fake end-of-image marker.
  class source_mgr : details::hermit {
    public:
      jpeg_source_mgr pub; //NOLINT(*non-private-member-*)

      explicit source_mgr(std::span<const std::byte> data) :
        pub{.next_input_byte   = utils::byte_pointer_cast<const JOCTET>(data.data()),
            .bytes_in_buffer   = data.size(),

            .init_source       = init_source,
            .fill_input_buffer = fill_input_buffer,
            .skip_input_data   = skip_input_data,
            .resync_to_restart = jpeg_resync_to_restart,
            .term_source       = term_source}
      {}



      [[nodiscard]] static source_mgr& get(j_decompress_ptr cinfo) {
        return *reinterpret_cast<source_mgr*>(cinfo->src); //NOLINT(*reinterpret-cast)
      }



    private:
      static void init_source(j_decompress_ptr /*unused*/) {}



      [[noreturn]] static boolean fill_input_buffer(j_decompress_ptr /*unused*/) {
        throw decode_error{codec::jpeg, "unexpected eof"};
      }



      static void skip_input_data(j_decompress_ptr cinfo, long num_bytes) {
        if (num_bytes <= 0) {
          return;
        }
        size_t nb = num_bytes;

        auto& self = get(cinfo);

        if (nb > self.pub.bytes_in_buffer) {
          throw decode_error{codec::jpeg, "unexpected eof"};
        }

        self.pub.next_input_byte += nb; //NOLINT(*pointer-arithmetic)
        self.pub.bytes_in_buffer -= nb;
      }



      static void term_source(j_decompress_ptr /*unused*/) {}
  };





  struct jds_destroyer {
    void operator()(jpeg_decompress_struct* cinfo) const {
      jpeg_destroy_decompress(cinfo);
      delete cinfo; //NOLINT
    }
  };





  // Reads markers up to the start of the first scan.
  class jpeg_probe : details::hermit {
    public:
      explicit jpeg_probe(details::probe_context& ctx) :
        ctx_    {&ctx},
        cinfo_  {new jpeg_decompress_struct()},
        src_mgr_{ctx.data()}
      {
        cinfo_->client_data = this;

        init_error();
        cinfo_->err = &err_mgr_;

        jpeg_create_decompress(cinfo_.get());
      }



      void run() {
        //NOLINTNEXTLINE(*reinterpret-cast)
        cinfo_->src = reinterpret_cast<jpeg_source_mgr*>(&src_mgr_);

        if (jpeg_read_header(cinfo_.get(), TRUE) != JPEG_HEADER_OK) {
          throw decode_error{codec::jpeg, "no image in datastream"};
        }

        if (cinfo_->image_width == 0 || cinfo_->image_height == 0) {
          throw decode_error{codec::jpeg, "empty image header"};
        }
      }



    private:
      details::probe_context*                                ctx_;
      std::unique_ptr<jpeg_decompress_struct, jds_destroyer> cinfo_;
      jpeg_error_mgr                                         err_mgr_{};
      source_mgr                                             src_mgr_;



      void init_error() {
        jpeg_std_error(&err_mgr_);

        err_mgr_.error_exit     = error_exit;
        err_mgr_.output_message = output_message;
      }



      static std::string message(j_common_ptr cinfo) {
        std::string message(JMSG_LENGTH_MAX, '\0');
        (*(cinfo->err->format_message))(cinfo, message.data());

        if (auto pos = message.find('\0'); pos != std::string::npos) {
          message.resize(pos);
        }

        return message;
      }



      [[noreturn]] static void error_exit(j_common_ptr cinfo) {
        throw decode_error{codec::jpeg, message(cinfo)};
      }



      static void output_message(j_common_ptr cinfo) {
        static_cast<jpeg_probe*>(cinfo->client_data)->ctx_->warn(
            "jpeg: " + message(cinfo));
      }
  };
}





void probe_jpeg(details::probe_context& ctx) {
  jpeg_probe probe{ctx};
  probe.run();
}
