// Copyright (c) 2023 wolmibo
// SPDX-License-Identifier: MIT

#ifndef IMGSNIFF_DETAILS_HERMIT_HPP_INCLUDED
#define IMGSNIFF_DETAILS_HERMIT_HPP_INCLUDED

namespace imgsniff::details {

// neither copyable nor movable; for wrappers handing `this` to C callbacks
class hermit {
  public:
    hermit() = default;

    hermit(const hermit&) = delete;
    hermit(hermit&&)      = delete;

    hermit& operator=(const hermit&) = delete;
    hermit& operator=(hermit&&)      = delete;

    ~hermit() = default;
};

}

#endif // IMGSNIFF_DETAILS_HERMIT_HPP_INCLUDED
