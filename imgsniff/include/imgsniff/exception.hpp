// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_EXCEPTION_HPP_INCLUDED
#define IMGSNIFF_EXCEPTION_HPP_INCLUDED

#include "imgsniff/codecs.hpp"

#include <source_location>
#include <string>
#include <string_view>



namespace imgsniff {

class base_exception : public std::exception {
  public:
    base_exception(const base_exception&) = default;
    base_exception(base_exception&&)      = default;
    base_exception& operator=(const base_exception&) = default;
    base_exception& operator=(base_exception&&)      = default;

    ~base_exception() override = default;



    explicit base_exception(
      const std::string&          what,
      const std::string&          additional = "",
      const std::source_location& location   = std::source_location::current()
    ) :
      what_    {what},
      detail_  {additional},
      message_ {std::string{"`"} + location.function_name() + "` "
                + what + ": " + additional},
      location_{location}
    {}



    [[nodiscard]] const char* what() const noexcept override {
      return what_.c_str();
    }

    [[nodiscard]] std::string_view            detail()   const { return detail_;   }
    [[nodiscard]] std::string_view            message()  const { return message_;  }
    [[nodiscard]] const std::source_location& location() const { return location_; }

    // single line form used for sniff warnings
    [[nodiscard]] std::string summary() const {
      return detail_.empty() ? what_ : what_ + ": " + detail_;
    }



   private:
     std::string          what_;
     std::string          detail_;
     std::string          message_;
     std::source_location location_;
};





class no_stream_access : public base_exception {
  public:
    no_stream_access(const no_stream_access&) = default;
    no_stream_access(no_stream_access&&)      = default;
    no_stream_access& operator=(const no_stream_access&) = default;
    no_stream_access& operator=(no_stream_access&&)      = default;

    ~no_stream_access() override = default;



    explicit no_stream_access(
      const std::string&          stream_name,
      const std::source_location& location = std::source_location::current()
    ) :
      base_exception{"no stream access", "cannot access stream " + stream_name, location},
      stream_name_  {stream_name}
    {}



    [[nodiscard]] std::string_view stream_name() const { return stream_name_; }



  private:
    std::string stream_name_;
};





class decode_error : public base_exception {
  public:
    decode_error(const decode_error&) = default;
    decode_error(decode_error&&)      = default;
    decode_error& operator=(const decode_error&) = default;
    decode_error& operator=(decode_error&&)      = default;

    ~decode_error() override = default;



    explicit decode_error(
        codec                       c,
        const std::string&          message  = {},
        const std::source_location& location = std::source_location::current()
    ) :
      base_exception{"cannot decode " + to_string(c), message, location},
      codec_        {c}
    {}



    [[nodiscard]] codec decoder() const { return codec_; }



  private:
    codec codec_;
};

}

#endif // IMGSNIFF_EXCEPTION_HPP_INCLUDED
