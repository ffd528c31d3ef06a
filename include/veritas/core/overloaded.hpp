#pragma once

/** \file overloaded.hpp
 *  \brief Overload set for std::visit. A missing alternative fails to compile.
 */

namespace veritas::core {

template <class... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};

template <class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace veritas::core
