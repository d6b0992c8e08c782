#pragma once

#include "ctdgbf/dataset.hpp"
#include "ctdgbf/error.hpp"
#include "ctdgbf/header.hpp"
#include "ctdgbf/mapping.hpp"
#include "ctdgbf/rows.hpp"

#include <string>
#include <vector>

namespace ctdgbf {

struct AssembleOptions {
    // A decreasing time step aborts the cast instead of raising a warning.
    bool strict_monotonic_time{false};

    std::string trajectory_id{"trajectory_001"};
    std::string title{"EAF-Nansen Programme CTD Data"};
    std::string summary{"CTD profile data converted from CNV to CF-compliant trajectory format."};
    std::string institution{"Institute of Marine Research (IMR)"};
    std::string source{"Sea-Bird CTD"};
    std::string references{"http://metadata.nmdc.no"};
    std::string history{}; // empty: generated from the header start time
};

/// Builds the CF trajectory dataset for one cast. Dimensions are
/// ("trajectory" = 1, "obs" = records.size()); every data variable is
/// (trajectory, obs) and linked to time/latitude/longitude.
/// Throws CastError(EmptyCast) for zero records.
Dataset assemble(const std::vector<ObservationRecord>& records,
                 const ColumnMapping& mapping,
                 const ParsedHeader& header,
                 const AssembleOptions& options,
                 Diagnostics& diags);

/// Converts one raw time column value to seconds since 1970-01-01T00:00:00Z,
/// NaN when the base it needs (the cast start) is unknown.
double to_unix_seconds(double raw, TimeBase base, const std::optional<Timestamp>& start);

} // namespace ctdgbf
