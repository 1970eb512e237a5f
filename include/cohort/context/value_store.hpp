#pragma once

#include <any>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace cohort::context {

namespace __values {

template <class T>
concept hashable_key = std::equality_comparable<T> && requires(const T& key) {
  { std::hash<T>{}(key) } -> std::convertible_to<std::size_t>;
};

// Character pointers, arrays and views are stored as std::string so that a literal
// finds a value stored under an equal std::string.
template <class T>
concept text_like = std::convertible_to<const T&, std::string_view>;

template <class T>
using stored_t = std::conditional_t<text_like<std::decay_t<T>>, std::string, std::decay_t<T>>;

template <class T>
concept integer_kind = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>
                       && !std::same_as<T, wchar_t> && !std::same_as<T, char8_t>
                       && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

template <class T>
concept streamable = requires(std::ostream& os, const T& v) { os << v; };

// Parses an integer accepting an optional sign, base prefixes (0x, 0o, 0b, or a leading
// 0 for octal) and '_' separators between digits when a prefix is present.
inline std::optional<std::int64_t> parse_integer(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  int  base     = 10;
  bool prefixed = false;
  if (text.size() > 1 && text.front() == '0') {
    switch (text[1]) {
      case 'x':
      case 'X':
        base = 16;
        text.remove_prefix(2);
        break;
      case 'o':
      case 'O':
        base = 8;
        text.remove_prefix(2);
        break;
      case 'b':
      case 'B':
        base = 2;
        text.remove_prefix(2);
        break;
      default:
        base = 8;
        text.remove_prefix(1);
        break;
    }
    prefixed = true;
  }

  std::string digits;
  digits.reserve(text.size());
  // '_' must follow a digit or the base prefix: "1_000" and "0x_1" parse, "1__0" and "1_" do not.
  bool after_digit = prefixed;
  for (char c : text) {
    if (c == '_') {
      if (!after_digit) {
        return std::nullopt;
      }
      after_digit = false;
      continue;
    }
    digits.push_back(c);
    after_digit = true;
  }
  if (digits.empty() || !after_digit) {
    return std::nullopt;
  }

  std::uint64_t magnitude = 0;
  const char*   first     = digits.data();
  const char*   last      = digits.data() + digits.size();
  auto [ptr, ec]          = std::from_chars(first, last, magnitude, base);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }

  constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (negative) {
    if (magnitude > max + 1) {
      return std::nullopt;
    }
    return magnitude == max + 1 ? std::numeric_limits<std::int64_t>::min()
                                : -static_cast<std::int64_t>(magnitude);
  }
  if (magnitude > max) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(magnitude);
}

template <class T>
std::string render(const std::any& value) {
  const auto& v = std::any_cast<const T&>(value);
  if constexpr (std::same_as<T, std::string>) {
    return v;
  } else if constexpr (std::formattable<T, char>) {
    return std::format("{}", v);
  } else if constexpr (streamable<T>) {
    std::ostringstream out;
    out << v;
    return out.str();
  } else {
    return typeid(T).name();
  }
}

template <class T>
std::optional<std::int64_t> to_integer(const std::any& value) {
  const auto& v = std::any_cast<const T&>(value);
  if constexpr (std::same_as<T, std::string>) {
    return parse_integer(v);
  } else if constexpr (integer_kind<T>) {
    if (!std::in_range<std::int64_t>(v)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
  } else {
    return std::nullopt;
  }
}

}  // namespace __values

// Type-erased key. Two keys are equal when they hold the same type and compare equal;
// a plain string key and a tagged key with the same text are different keys.
class any_key {
 public:
  template <class K>
    requires(!std::same_as<std::decay_t<K>, any_key>)
            && __values::hashable_key<__values::stored_t<K>>
  any_key(K&& key)  // NOLINT(google-explicit-constructor)
      : holder_(std::make_shared<holder<__values::stored_t<K>>>(
            __values::stored_t<K>(std::forward<K>(key)))) {}

  [[nodiscard]] std::size_t hash() const noexcept {
    return holder_->hash();
  }

  [[nodiscard]] std::type_index type() const noexcept {
    return holder_->type();
  }

  friend bool operator==(const any_key& lhs, const any_key& rhs) noexcept {
    return lhs.holder_->equals(*rhs.holder_);
  }

 private:
  struct holder_base {
    virtual ~holder_base() = default;

    [[nodiscard]] virtual std::type_index type() const noexcept                 = 0;
    [[nodiscard]] virtual std::size_t     hash() const noexcept                 = 0;
    [[nodiscard]] virtual bool            equals(const holder_base& other) const = 0;
  };

  template <class K>
  struct holder final : holder_base {
    explicit holder(K k) : key(std::move(k)) {}

    [[nodiscard]] std::type_index type() const noexcept override {
      return typeid(K);
    }

    [[nodiscard]] std::size_t hash() const noexcept override {
      return std::hash<std::type_index>{}(type()) ^ (std::hash<K>{}(key) << 1);
    }

    [[nodiscard]] bool equals(const holder_base& other) const override {
      if (other.type() != type()) {
        return false;
      }
      return static_cast<const holder&>(other).key == key;
    }

    K key;
  };

  std::shared_ptr<const holder_base> holder_;
};

struct any_key_hash {
  std::size_t operator()(const any_key& key) const noexcept {
    return key.hash();
  }
};

// Type-erased value remembering how to render itself as text and as an integer.
class any_value {
 public:
  template <class V>
    requires(!std::same_as<std::decay_t<V>, any_value>)
  any_value(V&& value)  // NOLINT(google-explicit-constructor)
      : value_(__values::stored_t<V>(std::forward<V>(value))),
        render_(&__values::render<__values::stored_t<V>>),
        to_integer_(&__values::to_integer<__values::stored_t<V>>) {}

  [[nodiscard]] const std::any& get() const noexcept {
    return value_;
  }

  [[nodiscard]] std::string to_string() const {
    return render_(value_);
  }

  [[nodiscard]] std::optional<std::int64_t> to_integer() const {
    return to_integer_(value_);
  }

 private:
  std::any value_;
  std::string (*render_)(const std::any&);
  std::optional<std::int64_t> (*to_integer_)(const std::any&);
};

struct key_value {
  any_key   key;
  any_value value;
};

// Thread-safe associative store with last-write-wins semantics. Values are not cleared
// when a scope is cancelled.
class value_store {
 public:
  value_store() = default;

  value_store(const value_store&)            = delete;
  value_store& operator=(const value_store&) = delete;

  void set(any_key key, any_value value) {
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(std::move(key), std::move(value));
  }

  // The stored value, or nullopt when the key is absent.
  [[nodiscard]] std::optional<std::any> try_get(const any_key& key) const {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second.get();
  }

  // The stored value, or an empty std::any when the key is absent.
  [[nodiscard]] std::any get(const any_key& key) const {
    return try_get(key).value_or(std::any{});
  }

  template <class T>
  [[nodiscard]] std::optional<T> get_as(const any_key& key) const {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (const auto* v = std::any_cast<T>(&it->second.get())) {
      return *v;
    }
    return std::nullopt;
  }

  // Text stored unchanged, other values rendered, "" when absent.
  [[nodiscard]] std::string get_string(const any_key& key) const {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      return {};
    }
    return it->second.to_string();
  }

  // Integer values directly, text parsed, 0 for anything else.
  [[nodiscard]] std::int64_t get_int(const any_key& key) const {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      return 0;
    }
    return it->second.to_integer().value_or(0);
  }

  [[nodiscard]] bool contains(const any_key& key) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(key);
  }

  bool erase(const any_key& key) {
    std::unique_lock lock(mutex_);
    return entries_.erase(key) > 0;
  }

  [[nodiscard]] std::size_t size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

 private:
  mutable std::shared_mutex                             mutex_;
  std::unordered_map<any_key, any_value, any_key_hash> entries_;
};

}  // namespace cohort::context
