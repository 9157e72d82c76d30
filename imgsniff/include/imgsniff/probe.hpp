// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_PROBE_HPP_INCLUDED
#define IMGSNIFF_PROBE_HPP_INCLUDED

#include "imgsniff/codecs.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>



namespace imgsniff {

struct probe_result {
  std::optional<std::string> format;
  std::vector<std::string>   warnings;
};



// Capability to recognize an image by handing its leading bytes to an image
// library. Implementations must not throw from probe().
class format_probe {
  public:
    format_probe() = default;

    format_probe(const format_probe&) = default;
    format_probe(format_probe&&)      = default;
    format_probe& operator=(const format_probe&) = default;
    format_probe& operator=(format_probe&&)      = default;

    virtual ~format_probe() = default;



    [[nodiscard]] virtual bool         available()                  const = 0;
    [[nodiscard]] virtual probe_result probe(std::span<const std::byte>) const = 0;
};





// Tries the image libraries compiled into this build, in the given order.
// Codecs without a decoder in this build are dropped.
class library_probe : public format_probe {
  public:
    library_probe();
    explicit library_probe(std::vector<codec>);



    [[nodiscard]] bool         available()                  const override;
    [[nodiscard]] probe_result probe(std::span<const std::byte>) const override;

    [[nodiscard]] std::span<const codec> codecs() const { return codecs_; }



  private:
    std::vector<codec> codecs_;
};





class null_probe : public format_probe {
  public:
    [[nodiscard]] bool available() const override { return false; }

    [[nodiscard]] probe_result probe(std::span<const std::byte> /*unused*/)
      const override {
      return {};
    }
};





// library_probe if any decoder library was enabled at build time,
// null_probe otherwise
[[nodiscard]] const format_probe& default_probe();

}

#endif // IMGSNIFF_PROBE_HPP_INCLUDED
