#pragma once

#include <cstddef>

namespace cairn::constants {

// ================================================================================================
// FUNDAMENTAL PHYSICAL CONSTANTS
// ================================================================================================

namespace physical {
/// Universal gas constant [J/(mol·K)]
inline constexpr double universal_gas_constant = 8.31446261815324;

/// Standard atmosphere [Pa]
inline constexpr double one_atmosphere = 101325.0;
}  // namespace physical

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Composition sum tolerance
inline constexpr double composition_sum = 1e-6;

/// Default enthalpy tolerance for a mechanism switch (relative)
inline constexpr double switch_enthalpy = 1e-4;

/// Default mole fraction tolerance for a mechanism switch
inline constexpr double switch_mole_fraction = 1e-4;

/// Values below this are treated as zero during renormalization
inline constexpr double negligible_fraction = 1e-300;
}  // namespace tolerance

// ================================================================================================
// DEFAULTS
// ================================================================================================

namespace defaults {
/// Mechanism used when neither the group nor phases.gas declares one
inline constexpr const char* mechanism = "air_5";

/// Default initial temperature [K]
inline constexpr double temperature = 300.0;

/// Default initial pressure [Pa]
inline constexpr double pressure = physical::one_atmosphere;

/// Default duration for an advance directive [s]
inline constexpr double advance_time = 1.0;

/// Explicit sub-steps used by the reference kinetics advance
inline constexpr int advance_substeps = 2000;

/// Name of the implicit stage created when a network declares no groups
inline constexpr const char* implicit_stage = "network";
}  // namespace defaults

// ================================================================================================
// FILE I/O AND FORMATTING CONSTANTS
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Default HDF5 chunk size for datasets
inline constexpr std::size_t default_hdf5_chunk_size = 1024;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Default version string written to output metadata
inline constexpr const char* default_cairn_version = "1.0.0";

/// Text written for a missing value in tabular output
inline constexpr const char* missing_value = "nan";
}  // namespace io

// ================================================================================================
// ARRAY AND INDEXING CONSTANTS
// ================================================================================================

namespace indexing {
/// First array index
inline constexpr std::size_t first = 0;

/// Second array index
inline constexpr std::size_t second = 1;
}  // namespace indexing

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
/// Format precision for floating point display
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_4 = 4;

/// Field width for tabular output
inline constexpr int medium_field_width = 10;

namespace colors {
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* cyan = "\033[36m";
}  // namespace colors
}  // namespace string_processing

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
/// Progress percentage conversion factor
inline constexpr double to_percentage = 100.0;
}  // namespace conversion

}  // namespace cairn::constants
