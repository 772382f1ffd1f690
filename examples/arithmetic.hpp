#pragma once

// Example contracted functions: integer division and square root.

#include "pactum/contract.hpp"

namespace pactum::examples {

// Floor division; std::domain_error on a zero divisor, std::overflow_error
// for INT_MIN / -1.
int floor_div(int a, int b);

// Always raises ImplementThis.
double sqrt_stub(double x);

const Contracted<int(int, int)>& div();
const Contracted<double(double)>& sqrt();

}  // namespace pactum::examples
