#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string_view>

namespace cova {

// Forward range of the lines of a buffer, without their '\n'.  A
// trailing '\r' is kept.  A final newline does not produce an extra
// empty line.
class linespan {
 public:
  using value_type = std::string_view;

  class iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string_view;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string_view*;
    using reference = const std::string_view&;

    iterator() = default;
    iterator(const char* pos, const char* end) : pos_{pos}, end_{end} {
      find_eol();
    }

    reference operator*() const { return line_; }
    pointer operator->() const { return &line_; }

    iterator& operator++() {
      pos_ = eol_ == end_ ? end_ : eol_ + 1;
      find_eol();
      return *this;
    }
    iterator operator++(int) {
      auto old = *this;
      ++*this;
      return old;
    }

    bool operator==(const iterator& other) const { return pos_ == other.pos_; }

    // Whether the current line was terminated by '\n'.
    [[nodiscard]] bool terminated() const { return eol_ != end_; }

   private:
    void find_eol() {
      eol_ = std::find(pos_, end_, '\n');
      line_ = std::string_view{pos_, static_cast<size_t>(eol_ - pos_)};
    }

    const char* pos_{};
    const char* end_{};
    const char* eol_{};
    std::string_view line_{};
  };

  explicit linespan(std::span<const char> buf) : buf_{buf} {}

  [[nodiscard]] iterator begin() const {
    return {buf_.data(), buf_.data() + buf_.size()};
  }
  [[nodiscard]] iterator end() const {
    auto* e = buf_.data() + buf_.size();
    return {e, e};
  }

 private:
  std::span<const char> buf_;
};

}  // namespace cova
