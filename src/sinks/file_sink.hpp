#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace sinks
{
    namespace fs = std::filesystem;

    class SinkError : public std::runtime_error
    {
    public:
        explicit SinkError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * Receives a finished CSV document and delivers it somewhere under the given
     * filename. Exporters only ever call `sink` once per export, and never for
     * an export that produced nothing.
     */
    class FileSink
    {
    public:
        virtual ~FileSink() = default;

        /**
         * @throws SinkError When the document can't be delivered.
         */
        virtual void sink(const std::string& content, const std::string& filename) = 0;
    };

    /**
     * Writes every document as `<directory>/<filename>`. The bytes go to a
     * partial file first, which is renamed into place once the write is complete,
     * so a failed export never leaves a truncated CSV behind.
     */
    class DirectorySink : public FileSink
    {
        fs::path p_directory;
    public:
        explicit DirectorySink(fs::path directory) : p_directory(std::move(directory)) {}

        [[nodiscard]] inline const fs::path& directory() const noexcept { return p_directory; }

        void sink(const std::string& content, const std::string& filename) override;
    };

    /**
     * Keeps every delivery in memory, in order.
     */
    class MemorySink : public FileSink
    {
    public:
        struct Delivery
        {
            std::string content;
            std::string filename;
        };

        void sink(const std::string& content, const std::string& filename) override
        {
            p_deliveries.push_back({ content, filename });
        }

        [[nodiscard]] inline const std::vector<Delivery>& deliveries() const noexcept { return p_deliveries; }
        [[nodiscard]] inline bool empty() const noexcept { return p_deliveries.empty(); }
        [[nodiscard]] inline const Delivery& last() const { return p_deliveries.back(); }

    private:
        std::vector<Delivery> p_deliveries;
    };

    /**
     * Owns a partial file for the length of a write. Unless `commit` moved it to
     * its final name, the file is removed when the guard goes out of scope.
     */
    class ScopedPartialFile
    {
        fs::path p_path;
        bool p_committed = false;
    public:
        explicit ScopedPartialFile(fs::path path) : p_path(std::move(path)) {}
        ~ScopedPartialFile();

        ScopedPartialFile(const ScopedPartialFile&) = delete;
        ScopedPartialFile& operator=(const ScopedPartialFile&) = delete;

        [[nodiscard]] inline const fs::path& path() const noexcept { return p_path; }

        void commit(const fs::path& destination);
    };
}
