#pragma once

#include <ostream>
#include <streambuf>
#include <string>
#include "PriceSeries.h"
#include "WaveSearchConfiguration.h"
#include "WaveSearchResult.h"

namespace wavescan
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers,
 * used to log to the console and a file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Name of the JSON export written when no explicit path is given,
 * e.g. "SPY_WavePatterns_20240131_154500.json".
 */
std::string createWavePatternsFileName(const std::string& securitySymbol);

/**
 * @brief Writes the search parameters and, per archetype, every accepted
 * pattern followed by the rejected ones when they were collected.
 */
void writeSearchReport(std::ostream& os,
                       const mkc_elliott::PriceSeries& series,
                       const mkc_elliott::WaveSearchConfiguration& config,
                       const mkc_elliott::WaveSearchResult& result);

} // namespace utils
} // namespace wavescan
