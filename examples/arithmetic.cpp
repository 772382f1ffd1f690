#include "arithmetic.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace pactum::examples {

int floor_div(int a, int b) {
  if (b == 0) throw std::domain_error("integer division or modulo by zero");
  if (a == std::numeric_limits<int>::min() && b == -1) {
    throw std::overflow_error("integer division result does not fit in int");
  }
  int q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

double sqrt_stub(double /*x*/) {
  throw ImplementThis("Square root function not yet implemented");
}

const Contracted<int(int, int)>& div() {
  static const auto fn =
      contract<int(int, int)>("div", &floor_div)
      | with_specification("Divides two integers and returns the result")
      | with_pre_description(
            "Both arguments must be integers, divisor cannot be zero, and the quotient must "
            "fit in int")
      | with_post_description("Returns the integer division of a by b")
      | with_declared_errors<PreconditionViolation, PostconditionViolation, std::domain_error,
                             std::overflow_error>()
      | with_precondition([](int, int b) { return b != 0; })
      | with_precondition([](int a, int b) {
          return !(a == std::numeric_limits<int>::min() && b == -1);
        })
      | with_postcondition([](int result, int a, int b) { return result == floor_div(a, b); });
  return fn;
}

const Contracted<double(double)>& sqrt() {
  static const auto fn =
      contract<double(double)>("sqrt", &sqrt_stub)
      | with_specification("Computes the square root of a non-negative number")
      | with_pre_description("Input must be non-negative")
      | with_post_description("Result squared equals the input")
      | with_declared_errors<PreconditionViolation, ImplementThis>()
      | with_precondition([](double x) { return x >= 0; })
      | with_postcondition([](double result, double x) { return std::fabs(result * result - x) < 1e-10; });
  return fn;
}

}  // namespace pactum::examples
