#pragma once

namespace gradebox {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const MultipleChoiceQuestion& q) { ... },
//       [](const CodingExerciseQuestion& q) { ... },
//   }, question);
//
// A missing alternative is a compile error rather than a silent default.

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace gradebox
