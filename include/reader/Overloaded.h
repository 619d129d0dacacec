#pragma once

namespace CartLink::Reader {

// Builds a std::visit visitor out of lambdas.
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace CartLink::Reader
