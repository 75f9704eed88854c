// diagnostics_json.hpp - JSON serialization for runtime diagnostics
#pragma once
#include "komrad/config.hpp"
#include "komrad/diagnostics.hpp"
#include <string>
#include <vector>

namespace komrad {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string: {"success":..,"errors":[..],"warnings":[..]}.
std::string diagnostics_to_json(const std::vector<Diagnostic>& diags);

// If env.diagJson (KOMRAD_DIAG_JSON=1), print diagnostics JSON to stderr.
void maybe_print_json(const DiagnosticSink& sink, const RuntimeEnv& env);

} // namespace komrad
