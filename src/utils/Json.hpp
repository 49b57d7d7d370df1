#pragma once

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

namespace tr::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    return Document(
        yyjson_read(payload.data(), payload.size(), static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

// Raw values handed out by the cache point into a parsed reply; the shared
// owner keeps that reply alive for as long as any slot references it.
using SharedDocument = std::shared_ptr<Document const>;

inline SharedDocument share(Document document) {
  return std::make_shared<Document const>(std::move(document));
}

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  // Document whose root is an empty object, ready for yyjson_mut_obj_add_*.
  static MutableDocument object() {
    MutableDocument document;
    if (document.doc_) {
      document.set_root(yyjson_mut_obj(document.doc_));
    }
    return document;
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

inline std::optional<std::int64_t> get_int(yyjson_val *value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_sint(value)) {
    return static_cast<std::int64_t>(yyjson_get_sint(value));
  }
  if (yyjson_is_uint(value)) {
    auto number = yyjson_get_uint(value);
    if (number > static_cast<std::uint64_t>(INT64_MAX)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(number);
  }
  if (yyjson_is_real(value)) {
    // [-2^63, 2^63) is exactly what fits; NaN fails both tests.
    auto real = yyjson_get_real(value);
    if (!(real >= -9223372036854775808.0 && real < 9223372036854775808.0)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(real);
  }
  return std::nullopt;
}

inline std::optional<double> get_real(yyjson_val *value) {
  if (value == nullptr || !yyjson_is_num(value)) {
    return std::nullopt;
  }
  return yyjson_get_num(value);
}

inline std::optional<std::string_view> get_string(yyjson_val *value) {
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string_view(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<bool> get_bool(yyjson_val *value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_bool(value)) {
    return yyjson_get_bool(value);
  }
  if (auto number = get_int(value)) {
    return *number != 0;
  }
  return std::nullopt;
}

inline yyjson_val *member(yyjson_val *object, char const *key) {
  return (object && yyjson_is_obj(object)) ? yyjson_obj_get(object, key) : nullptr;
}

inline yyjson_mut_val *int_array(yyjson_mut_doc *doc, std::vector<int> const &values) {
  auto *array = yyjson_mut_arr(doc);
  for (int value : values) {
    yyjson_mut_arr_add_sint(doc, array, value);
  }
  return array;
}

inline yyjson_mut_val *string_array(yyjson_mut_doc *doc,
                                    std::vector<std::string> const &values) {
  auto *array = yyjson_mut_arr(doc);
  for (auto const &value : values) {
    yyjson_mut_arr_add_strncpy(doc, array, value.data(), value.size());
  }
  return array;
}

inline std::string write(yyjson_val *value) {
  if (value == nullptr) {
    return {};
  }
  char *json = yyjson_val_write(value, 0, nullptr);
  std::string result = json ? json : "";
  std::free(json);
  return result;
}

} // namespace tr::json
