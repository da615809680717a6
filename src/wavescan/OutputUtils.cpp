#include "OutputUtils.h"
#include <cstdio>
#include <iomanip>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace mkc_elliott;

namespace wavescan
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string createWavePatternsFileName(const std::string& securitySymbol)
{
    const std::string stamp =
        boost::posix_time::to_iso_string(boost::posix_time::second_clock::local_time());

    // to_iso_string gives YYYYMMDDTHHMMSS
    std::string timestamp = stamp.substr(0, 8) + "_" + stamp.substr(9, 6);
    const std::string symbol = securitySymbol.empty() ? std::string("Series") : securitySymbol;
    return symbol + "_WavePatterns_" + timestamp + ".json";
}

namespace
{
    void writeCandidate(std::ostream& os, const PriceSeries& series, const WaveCandidate& candidate)
    {
        const WavePattern& pattern = candidate.pattern;
        const auto labels = pattern.labels();

        os << "    " << candidate.option << "  bars " << pattern.getIdxStart()
           << "-" << pattern.getIdxEnd() << "  "
           << boost::posix_time::to_simple_string(series.getDates()[pattern.getIdxStart()])
           << " .. "
           << boost::posix_time::to_simple_string(series.getDates()[pattern.getIdxEnd()])
           << std::endl;

        for (std::size_t i = 0; i < pattern.getNumWaves(); ++i)
        {
            const MonoWave& wave = pattern.getWaves()[i];
            os << "      " << std::setw(2) << labels[i + 1] << "  " << wave << std::endl;
        }

        if (pattern.getViolation())
            os << "      violation: " << *pattern.getViolation() << std::endl;
    }
}

void writeSearchReport(std::ostream& os,
                       const PriceSeries& series,
                       const WaveSearchConfiguration& config,
                       const WaveSearchResult& result)
{
    os << std::endl << "Wave search on " << series.getSymbol() << " (" << series.size() << " bars)" << std::endl;
    os << "Start: bar " << result.getStartIndex() << " "
       << boost::posix_time::to_simple_string(series.getDates()[result.getStartIndex()]) << std::endl;
    os << config;
    os << "Impulse combinations evaluated: " << result.getImpulseOptionsEvaluated() << std::endl;
    os << "Correction combinations evaluated: " << result.getCorrectionOptionsEvaluated()
       << " from " << result.getCorrectionStarts().size() << " start bar(s)" << std::endl;
    if (result.isCancelled())
        os << "Search was cancelled before all combinations were evaluated" << std::endl;

    for (const auto& archetypeResult : result.getArchetypeResults())
    {
        os << std::endl << toString(archetypeResult.getArchetype()) << ": "
           << archetypeResult.getAccepted().size() << " accepted";
        if (config.collectRejections())
            os << ", " << archetypeResult.getRejected().size() << " rejected";
        os << std::endl;

        for (const auto& candidate : archetypeResult.getAccepted())
            writeCandidate(os, series, candidate);

        if (config.collectRejections() && !archetypeResult.getRejected().empty())
        {
            os << "  Rejected:" << std::endl;
            for (const auto& candidate : archetypeResult.getRejected())
                writeCandidate(os, series, candidate);
        }
    }
}

} // namespace utils
} // namespace wavescan
