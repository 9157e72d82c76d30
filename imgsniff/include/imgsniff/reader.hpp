// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_READER_HPP_INCLUDED
#define IMGSNIFF_READER_HPP_INCLUDED

#include "imgsniff/exception.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>



namespace imgsniff {

// Read-only binary file handle, closed on destruction.
// Throws no_stream_access if the file cannot be opened.
class reader {
  public:
    explicit reader(const std::filesystem::path&);

    reader(const reader&) = delete;
    reader(reader&&) noexcept;

    reader& operator=(const reader&) = delete;
    reader& operator=(reader&&) noexcept;

    ~reader();



    // short count at end of file
    [[nodiscard]] size_t read(std::span<std::byte>);



  private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}


#endif // IMGSNIFF_READER_HPP_INCLUDED
