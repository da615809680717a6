// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PriceSeriesCsvReader.h"
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace mkc_elliott
{
  namespace
  {
    double parsePrice(const std::string& field, const std::string& value, std::size_t row)
    {
      try
	{
	  return boost::lexical_cast<double>(value);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw PriceSeriesException("Row " + std::to_string(row) + ": cannot read " + field +
				     " price '" + value + "'");
	}
    }
  }

  ptime parseBarDate(const std::string& dateStamp)
  {
    const std::string stamp = boost::algorithm::trim_copy(dateStamp);

    try
      {
	std::string datePart = stamp;
	std::string timePart;
	if (auto sp = stamp.find(' '); sp != std::string::npos)
	  {
	    datePart = stamp.substr(0, sp);
	    timePart = boost::algorithm::trim_copy(stamp.substr(sp + 1));
	  }

	boost::gregorian::date d;
	if (datePart.find('-') != std::string::npos)
	  d = boost::gregorian::from_simple_string(datePart);
	else
	  d = boost::gregorian::from_undelimited_string(datePart);

	if (d.is_special())
	  throw PriceSeriesException("Invalid date '" + dateStamp + "'");

	if (timePart.empty())
	  return ptime(d);

	return ptime(d, boost::posix_time::duration_from_string(timePart));
      }
    catch (const PriceSeriesException&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw PriceSeriesException("Invalid date '" + dateStamp + "': " + e.what());
      }
  }

  PriceSeriesCsvReader::PriceSeriesCsvReader(const std::string& fileName, const std::string& symbol)
    : mFileName(fileName),
      mSeries(symbol)
  {}

  void PriceSeriesCsvReader::readFile()
  {
    if (!boost::filesystem::exists(boost::filesystem::path(mFileName)))
      throw PriceSeriesException("Price file " + mFileName + " does not exist");

    PriceSeries series(mSeries.getSymbol());

    try
      {
	io::CSVReader<5, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> csvFile(mFileName);
	csvFile.read_header(io::ignore_extra_column, "Date", "Open", "High", "Low", "Close");

	std::string dateStamp, openString, highString, lowString, closeString;
	std::size_t row = 1;

	while (csvFile.read_row(dateStamp, openString, highString, lowString, closeString))
	  {
	    ++row;
	    series.addBar(OHLCBar(parseBarDate(dateStamp),
				  parsePrice("Open", openString, row),
				  parsePrice("High", highString, row),
				  parsePrice("Low", lowString, row),
				  parsePrice("Close", closeString, row)));
	  }
      }
    catch (const io::error::base& e)
      {
	throw PriceSeriesException("Error reading price file " + mFileName + ": " + e.what());
      }

    mSeries = series;
  }
} // namespace mkc_elliott
