#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace tacit {

// Reference-counted element storage. Copies and sub-slices share the same
// buffer; make_mut() detaches before any write when the buffer is shared.
template <typename T>
class CowSlice {
 public:
  using value_type = T;

  CowSlice() = default;

  explicit CowSlice(std::vector<T> values)
      : data_(std::make_shared<std::vector<T>>(std::move(values))), start_(0), end_(data_->size()) {}

  std::size_t size() const { return end_ - start_; }
  bool empty() const { return end_ == start_; }

  const T* data() const { return data_ ? data_->data() + start_ : nullptr; }
  const T* begin() const { return data(); }
  const T* end() const { return data() + size(); }
  const T& operator[](std::size_t index) const { return (*data_)[start_ + index]; }

  CowSlice slice(std::size_t begin, std::size_t finish) const {
    CowSlice out;
    out.data_ = data_;
    out.start_ = start_ + begin;
    out.end_ = start_ + finish;
    return out;
  }

  bool is_unique() const {
    return data_ && data_.use_count() == 1 && start_ == 0 && end_ == data_->size();
  }

  bool shares_storage_with(const CowSlice& other) const {
    return data_ && data_ == other.data_;
  }

  T* make_mut() {
    if (!is_unique()) {
      data_ = std::make_shared<std::vector<T>>(begin(), end());
      start_ = 0;
      end_ = data_->size();
    }
    return data_->data();
  }

  std::vector<T> to_vector() const { return std::vector<T>(begin(), end()); }

 private:
  std::shared_ptr<std::vector<T>> data_;
  std::size_t start_ = 0;
  std::size_t end_ = 0;
};

}  // namespace tacit
