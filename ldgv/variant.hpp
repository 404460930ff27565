#ifndef LDGV_VARIANT_HPP
#define LDGV_VARIANT_HPP

#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace ldgv {

// overloaded lambdas for match
template<class...> struct overload;

template<> struct overload<> {
  void operator()() const;
};

template<class F, class ... Fs>
struct overload<F, Fs...>: F, overload<Fs...> {
  using F::operator();
  using overload<Fs...>::operator();

  overload(F f, Fs...fs): F{f}, overload<Fs...>{fs...} { }
};


namespace detail {

template<std::size_t I, class T>
struct type_index {
  friend constexpr std::integral_constant<std::size_t, I> get_index(type_index, const T*) {
    return {};
  }
};

template<class Is, class... Ts>
struct type_indices;

template<std::size_t... Is, class... Ts>
struct type_indices<std::index_sequence<Is...>, Ts...>: type_index<Is, Ts>... { };

} // namespace detail


// immutable tagged union with shared payload: copies are cheap and safe to
// hand over to other threads
template<class... Args>
class variant {
  struct base {
    const std::size_t index;
  };

  template<class T>
  struct derived: base {
    const T value;
    derived(std::size_t index, const T& value): base{index}, value{value} {}
  };

  std::shared_ptr<const base> storage;
  using type_index = detail::type_indices<std::index_sequence_for<Args...>, Args...>;

public:
  // alternative index of T, matching type()
  template<class T>
  static constexpr std::size_t index_of() {
    return decltype(get_index(type_index{}, (const T*)nullptr))::value;
  }

  template<class T, class = decltype(get_index(type_index{}, (const T*)nullptr))>
  variant(const T& value):
    storage(std::make_shared<derived<T>>(index_of<T>(), value)) {}

  variant(const variant&) = default;
  variant(variant&&) = default;

  variant& operator=(const variant&) = default;
  variant& operator=(variant&&) = default;

  template<class Visitor>
  friend auto visit(const variant& self, Visitor visitor) {
    using result_type =
        typename std::common_type<typename std::result_of<Visitor(const Args&)>::type...>::type;
    using thunk_type = result_type (*)(const base*, const Visitor& visitor);

    const thunk_type table[] = {+[](const base* ptr, const Visitor& visitor) -> result_type {
      return visitor(static_cast<const derived<Args>*>(ptr)->value);
    }...};

    return table[self.storage->index](self.storage.get(), visitor);
  }

  template<class... Cases>
  friend auto match(const variant& self, Cases... cases) {
    return visit(self, overload<Cases...>{cases...});
  }

  template<class T>
  bool is() const { return storage->index == index_of<T>(); }

  // nullptr if the variant does not hold a T
  template<class T>
  const T* cast() const {
    if(!is<T>()) return nullptr;
    return &static_cast<const derived<T>*>(storage.get())->value;
  }

  template<class T>
  const T& get() const {
    if(const T* res = cast<T>()) return *res;
    throw std::bad_cast();
  }

  std::size_t type() const { return storage->index; }
};

} // namespace ldgv

#endif
