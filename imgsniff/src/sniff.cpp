#include "imgsniff/exception.hpp"
#include "imgsniff/reader.hpp"
#include "imgsniff/sniff.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

using namespace imgsniff;



namespace {
  // up to header_size leading bytes of the source; empty if there are none
  [[nodiscard]] std::vector<std::byte> load_header(
      const source&        input,
      size_t               header_size,
      sniff_report&        report
  ) {
    if (const auto* bytes = std::get_if<std::span<const std::byte>>(&input)) {
      auto head = bytes->first(std::min(header_size, bytes->size()));
      return {head.begin(), head.end()};
    }

    if (const auto* path = std::get_if<std::filesystem::path>(&input)) {
      try {
        reader r{*path};

        std::vector<std::byte> buffer(header_size);
        buffer.resize(r.read(buffer));
        return buffer;
      } catch (const no_stream_access& ex) {
        report.warnings.emplace_back(ex.summary());
        return {};
      }
    }

    report.warnings.emplace_back("no input given");
    return {};
  }



  void run_probe(
      const format_probe&        probe,
      std::span<const std::byte> data,
      sniff_report&              report
  ) {
    if (!probe.available() || data.empty()) {
      return;
    }

    auto result = probe.probe(data);
    std::ranges::move(result.warnings, std::back_inserter(report.warnings));

    if (result.format && !result.format->empty()) {
      std::ranges::transform(*result.format, result.format->begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
      });

      report.format   = std::move(result.format);
      report.found_by = origin::decoder;
    }
  }
}





sniff_report imgsniff::sniff(
    const source&                             input,
    std::optional<std::span<const std::byte>> header,
    const sniff_options&                      options
) {
  sniff_report report;

  std::vector<std::byte> loaded;
  if (!header) {
    loaded = load_header(input, options.header_size, report);
    header = std::span<const std::byte>{loaded};
  }

  if (options.use_decoders) {
    run_probe(options.probe != nullptr ? *options.probe : default_probe(),
        *header, report);

    if (report.format) {
      return report;
    }
  }

  if (header->empty()) {
    return report;
  }

  if (auto fmt = match_signature(*header, options.signatures)) {
    report.format   = std::move(fmt);
    report.found_by = origin::signature;
  }

  return report;
}



std::optional<std::string> imgsniff::what(
    const source&                             input,
    std::optional<std::span<const std::byte>> header,
    const sniff_options&                      options
) {
  return sniff(input, header, options).format;
}





std::string_view imgsniff::stringify(origin o) {
  switch (o) {
    case origin::none:      return "none";
    case origin::decoder:   return "decoder";
    case origin::signature: return "signature";
  }

  return "<invalid origin>";
}
