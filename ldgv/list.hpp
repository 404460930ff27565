#ifndef LDGV_LIST_HPP
#define LDGV_LIST_HPP

#include <memory>

namespace ldgv {

template<class T>
struct cons;

// immutable singly-linked list, nullptr is the empty list
template<class T>
using list = std::shared_ptr<const cons<T>>;

template<class T>
struct cons {
  const T head;
  const list<T> tail;
  cons(T head, list<T> tail): head(std::move(head)), tail(std::move(tail)) { }

  struct iterator {
    list<T> data;
    iterator& operator++() { data = data->tail; return *this; }
    bool operator!=(const iterator& other) const { return data != other.data; }
    const T& operator*() const { return data->head; }
  };
};


template<class T>
static list<T> operator%=(T head, list<T> tail) {
  return std::make_shared<cons<T>>(std::move(head), std::move(tail));
}

template<class T>
static typename cons<T>::iterator begin(const list<T>& self) { return {self}; }

template<class T>
static typename cons<T>::iterator end(const list<T>&) { return {nullptr}; }

template<class T>
static std::size_t length(list<T> self) {
  std::size_t res = 0;
  for(; self; self = self->tail) ++res;
  return res;
}


template<class Iterator>
static list<typename Iterator::value_type> make_list(Iterator first, Iterator last) {
  list<typename Iterator::value_type> res;
  while(first != last) {
    res = std::move(*--last) %= res;
  }
  return res;
}

} // namespace ldgv

#endif
