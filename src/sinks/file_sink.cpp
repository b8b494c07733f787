#include "file_sink.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace sinks
{
    ScopedPartialFile::~ScopedPartialFile()
    {
        if (p_committed)
            return;

        std::error_code ec;
        fs::remove(p_path, ec);
        if (ec)
            spdlog::warn("Unable to remove partial file {}: {}", p_path.string(), ec.message());
    }

    void ScopedPartialFile::commit(const fs::path& destination)
    {
        std::error_code ec;
        fs::rename(p_path, destination, ec);
        if (ec)
            throw SinkError("unable to move " + p_path.string() + " to " + destination.string() + ": " + ec.message());
        p_committed = true;
    }

    void DirectorySink::sink(const std::string& content, const std::string& filename)
    {
        if (filename.empty() || fs::path(filename).filename() != fs::path(filename))
            throw SinkError("'" + filename + "' is not a plain file name");

        // An ofstream won't create missing parent directories.
        std::error_code ec;
        if (!fs::is_directory(p_directory))
            fs::create_directories(p_directory, ec);
        if (ec)
            throw SinkError("unable to create " + p_directory.string() + ": " + ec.message());

        auto destination = p_directory / filename;
        ScopedPartialFile partial{ p_directory / (filename + ".part") };

        {
            std::ofstream out(partial.path(), std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out)
                throw SinkError("unable to open " + partial.path().string() + " for writing");

            out.write(content.data(), (std::streamsize)content.size());
            out.flush();
            if (!out)
                throw SinkError("unable to write " + partial.path().string());
        }

        partial.commit(destination);
        spdlog::info("Wrote {} ({} bytes)", destination.string(), content.size());
    }
}
