#pragma once

#include <memory>
#include <string>
#include <typeinfo>

#include "lazyhold/LazyHolder.hpp"

/**
 * Process-wide instance of T, built on first use. The holder is a
 * function-local static, so its own construction is thread-safe and there is
 * no global pointer to manage. A type with a private constructor can declare
 * `friend class Singleton<T>;`.
 */
template <typename T>
class Singleton
{
public:
  static std::shared_ptr<T> instance() {
    return holder().getInstance();
  }

  static LazyHolder<T> &holder() {
    static LazyHolder<T> s_holder(
      [] { return std::shared_ptr<T>(new T()); },
      std::string("Singleton<") + typeid(T).name() + ">");
    return s_holder;
  }

private:
  Singleton() = default;
};
