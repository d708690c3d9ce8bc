#pragma once

#include <string>
#include <string_view>

#include "verdict/common/diagnostic.hpp"
#include "verdict/invoker/test_invoker.hpp"

namespace verdict::driver {

void PrintError(const std::string& message);
void PrintNote(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// Unified diff with +/- lines colored when stderr is a terminal.
void PrintDiff(std::string_view diff);

// Everything a failing run has to say: which stream differed and how,
// missing files, launch failures, cleanup warnings. Silent on a clean pass.
void PrintReport(const invoker::InvocationReport& report);

}  // namespace verdict::driver
