#include "Plotter.hpp"

namespace sb {
FunctionPlotter::FunctionPlotter(const string& _name, function<int()> _valueFn,
                                 function<void()> _resetFn)
    : Plotter(_name), valueFn(_valueFn), resetFn(_resetFn) {
  CHECK(valueFn) << "Plotter " << _name << " needs a value function";
}

int FunctionPlotter::getValue() { return valueFn(); }

void FunctionPlotter::reset() {
  if (resetFn) {
    resetFn();
  }
}
}  // namespace sb
