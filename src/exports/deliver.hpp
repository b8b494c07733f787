#pragma once

#include <optional>

#include <spdlog/spdlog.h>

#include "exports.hpp"

namespace exports::detail
{
    /**
     * Runs `build` on the list and hands the result to the sink. Nothing reaches
     * the sink when the list is missing, empty, or the build has no document.
     */
    template<typename Build>
    bool deliver(const TransactionList* transactions, sinks::FileSink& sink, Build build)
    {
        if (transactions == nullptr || transactions->empty())
            return false;

        std::optional<CsvDocument> document = build(*transactions);
        if (!document)
            return false;

        spdlog::debug("Exporting {} ({} bytes)", document->filename, document->content.size());
        sink.sink(document->content, document->filename);
        return true;
    }
}
