#pragma once

#include "compiler/step.hpp"

#include <string>

namespace render {

// Opens the script: START line, output helpers, start of run().
std::string prologue(const RenderContext& ctx);

// Closes run(), invokes it and prints FINISH.
std::string epilogue(const RenderContext& ctx);

// Script text for one step. Pure function of its arguments.
std::string step(const Step& step, const RenderContext& ctx);

} // namespace render
