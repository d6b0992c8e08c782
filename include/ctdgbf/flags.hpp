#pragma once

#include "ctdgbf/dataset.hpp"
#include "ctdgbf/qc.hpp"

#include <string>
#include <vector>

namespace ctdgbf {

struct QcOptions {
    bool emit_check_variables{false}; // also write <var>_qc_<check> and its bounds
    bool replace_existing{false};     // overwrite QC variables from an earlier run
};

inline constexpr const char* kFlagValues = "1 2 3 4 9";
inline constexpr const char* kFlagMeanings = "GOOD NOT_EVALUATED SUSPECT FAIL MISSING";

/// FAIL > SUSPECT > NOT_EVALUATED > GOOD per point; MISSING wherever `missing`
/// is set. With no results every present point is NOT_EVALUATED.
std::vector<FlagValue> aggregate(const std::vector<QCResult>& results, const std::vector<bool>& missing);

/// Appends "<variable>_qc" (and per-check variables on request) to `ds` in a
/// single Dataset::commit.
void attach_qc(Dataset& ds, const std::string& variable, const std::vector<QCResult>& results,
               const QcOptions& options);

} // namespace ctdgbf
