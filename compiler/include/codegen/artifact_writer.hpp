//! # Artifact Writer
//!
//! Writes a module's `<module>.h` and `<module>.c` into an output
//! directory, creating the directory when needed. Any I/O failure is an
//! `OutputError` diagnostic.

#pragma once

#include "codegen/c_emitter.hpp"

#include <filesystem>

namespace a2c::codegen {

/// Paths of the two files written for one module.
struct WrittenArtifacts {
    std::filesystem::path header;
    std::filesystem::path source;
};

[[nodiscard]] auto write_artifacts(const EmittedArtifacts& artifacts,
                                   const std::filesystem::path& output_dir)
    -> Result<WrittenArtifacts, diag::Diagnostic>;

} // namespace a2c::codegen
