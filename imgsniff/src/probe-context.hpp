#ifndef IMGSNIFF_PROBE_CONTEXT_HPP_INCLUDED
#define IMGSNIFF_PROBE_CONTEXT_HPP_INCLUDED

#include <algorithm>
#include <span>
#include <string>
#include <utility>
#include <vector>



namespace imgsniff::details {

// In-memory input for one decoder pass plus the warnings it emits.
class probe_context {
  public:
    explicit probe_context(std::span<const std::byte> input) :
      input_{input}
    {}



    [[nodiscard]] size_t read(std::span<std::byte> buffer) {
      auto count = std::min(buffer.size(), input_.size() - position_);
      std::ranges::copy(input_.subspan(position_, count), buffer.begin());
      position_ += count;
      return count;
    }

    [[nodiscard]] std::span<const std::byte> data() const { return input_; }



    void warn(std::string msg) {
      warnings_.emplace_back(std::move(msg));
    }

    [[nodiscard]] std::vector<std::string> take_warnings() {
      return std::exchange(warnings_, {});
    }



  private:
    std::span<const std::byte> input_;
    size_t                     position_{0};
    std::vector<std::string>   warnings_;
};

}

#endif // IMGSNIFF_PROBE_CONTEXT_HPP_INCLUDED
