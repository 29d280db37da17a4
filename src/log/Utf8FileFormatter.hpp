#pragma once

#include <plog/Formatters/TxtFormatter.h>
#include <plog/Util.h>

// File formatter for normalization logs.
// Previews carry raw UTF-8 (CJK punctuation, currency signs); no BOM is written
// so the files stay byte-identical to what the pipeline saw.
struct Utf8FileFormatter
{
    static plog::util::nstring header()
    {
        return plog::util::nstring();
    }

    static plog::util::nstring format(const plog::Record& record)
    {
        return plog::TxtFormatter::format(record);
    }
};
