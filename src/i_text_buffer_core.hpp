#pragma once
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

template <typename Derived>
class TextBufferCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init_from_lines(std::vector<std::string>&& lines) { as_derived().do_init_from_lines(std::move(lines)); }
  int line_count() const { return as_const_derived().do_line_count(); }
  /*view stays valid until the next mutation*/
  std::string_view line_view(int r) const { return as_const_derived().do_line_view(r); }
  /*insert*/
  void insert_line(size_t row, std::string_view s) { as_derived().do_insert_line(row, s); }
  /*erase*/
  void erase_line(size_t row) { as_derived().do_erase_line(row); }
  void erase_lines(size_t start_row, size_t end_row) { as_derived().do_erase_lines(start_row, end_row); }
  /*replace*/
  void replace_line(size_t row, std::string_view s) { as_derived().do_replace_line(row, s); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextBufferCoreCRTPConcept =
    std::derived_from<T, TextBufferCoreCRTP<T>> &&
    requires(T& t, const T& ct, std::vector<std::string>&& lines, size_t row, std::string_view s) {
      { T::get_name_sv() } -> std::convertible_to<std::string_view>;
      t.do_init_from_lines(std::move(lines));
      { ct.do_line_count() } -> std::convertible_to<int>;
      { ct.do_line_view(0) } -> std::convertible_to<std::string_view>;
      t.do_insert_line(row, s);
      t.do_erase_line(row);
      t.do_erase_lines(row, row);
      t.do_replace_line(row, s);
    };
