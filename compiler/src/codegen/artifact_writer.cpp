#include "codegen/artifact_writer.hpp"

#include "log/log.hpp"

#include <fstream>

namespace a2c::codegen {

namespace fs = std::filesystem;

namespace {

auto write_file(const fs::path& path, const std::string& content, const std::string& module)
    -> Result<Unit, diag::Diagnostic> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return diag::make_diagnostic(diag::ErrorKind::OutputError, module, path.filename().string(),
                                     "cannot open '" + path.string() + "' for writing");
    }
    file << content;
    file.close();
    if (!file) {
        return diag::make_diagnostic(diag::ErrorKind::OutputError, module, path.filename().string(),
                                     "failed writing '" + path.string() + "'");
    }
    A2C_LOG_TRACE("codegen", "Wrote " << content.size() << " bytes to " << path.string());
    return Unit{};
}

} // namespace

auto write_artifacts(const EmittedArtifacts& artifacts, const fs::path& output_dir)
    -> Result<WrittenArtifacts, diag::Diagnostic> {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return diag::make_diagnostic(diag::ErrorKind::OutputError, artifacts.module, "",
                                     "cannot create output directory '" + output_dir.string() +
                                         "': " + ec.message());
    }

    WrittenArtifacts written{output_dir / artifacts.header_name(),
                             output_dir / artifacts.source_name()};

    auto header = write_file(written.header, artifacts.header, artifacts.module);
    if (is_err(header)) {
        return unwrap_err(header);
    }
    auto source = write_file(written.source, artifacts.source, artifacts.module);
    if (is_err(source)) {
        return unwrap_err(source);
    }

    A2C_LOG_INFO("codegen", "Wrote " << written.header.string() << " and "
                                     << written.source.string());
    return written;
}

} // namespace a2c::codegen
