#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ds {

// Lightweight view over a parsed record; header_ optionally points to the
// column names captured from the first record.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::vector<std::string>* header,
             const std::vector<std::string>* fields)
      : header_(header), fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  // Get field by index.
  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? std::string_view((*fields_)[i]) : std::string_view{};
  }

  // Column name for index i, empty when there is no header or it is shorter.
  std::string_view colname(std::size_t i) const {
    return (header_ && i < header_->size()) ? std::string_view((*header_)[i]) : std::string_view{};
  }

  bool has_header() const noexcept { return header_ && !header_->empty(); }

  const std::vector<std::string>* header() const noexcept { return header_; }
  const std::vector<std::string>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string>* header_{nullptr};
  const std::vector<std::string>* fields_{nullptr};
};

}
