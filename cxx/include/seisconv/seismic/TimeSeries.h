#ifndef _SEISCONV_TIMESERIES_H_
#define _SEISCONV_TIMESERIES_H_
#include <string>
#include <vector>
#include <boost/serialization/base_object.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include "seisconv/seismic/BasicTimeSeries.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/ErrorLogger.h"
namespace seisconv::seismic{
/*! \brief Scalar waveform record.

This data object extends BasicTimeSeries by adding a vector of samples,
a header (Metadata) and an error log.  The header holds the SAC style
attributes defined in keywords.h.  The attributes that duplicate
BasicTimeSeries values (delta, b, npts) are kept in sync by the setters.
The derived attributes (e, depmin, depmax, depmen) are refreshed by
sync_header, which must be called after any change to the sample vector.
\author seisconv developers
**/
class TimeSeries : public seisconv::seismic::BasicTimeSeries,
    public seisconv::utility::Metadata
{
public:
/*!
Sample data.  std::vector guarantees contiguous storage so BLAS routines
can be used on &(d.s[0]).
**/
	std::vector<double> s;
/*! Error log for this record. */
	seisconv::utility::ErrorLogger elog;
/*!
Default constructor.  Creates an empty record marked dead.  The header
is initialized as an evenly sampled time series (iftype=itime, leven=true).
**/
	TimeSeries();
/*!
Allocates nsin samples initialized to 0.0.  The result is marked dead
because the assumption is the caller will load data and then call
set_live.
**/
	TimeSeries(const size_t nsin);
/*! Construct from components.  The sample vector is allocated to
 bts.npts() zeros and the header is refreshed from the BasicTimeSeries
 values. */
	TimeSeries(const BasicTimeSeries& bts,const seisconv::utility::Metadata& md);
	TimeSeries(const TimeSeries&);
	TimeSeries& operator=(const TimeSeries&);
	/*! Set the sample interval in both the object and the header. */
	void set_dt(const double sample_interval);
	/*! \brief Set the number of samples.

	The sample buffer is cleared and resized to npts zeros.  Call this
	before loading data, not after.
	*/
	void set_npts(const size_t npts);
	/*! Set the begin time in both the object and the header. */
	void set_t0(const double t0in);
	/*! \brief Make npts match the size of the sample vector.

	Use this after an operation that changes the size of s directly.
	Unlike set_npts the buffer is not touched. */
	void sync_npts();
	/*! \brief Refresh all derived header attributes.

	Runs sync_npts and then sets e from b, delta, and npts and recomputes
	depmin, depmax, and depmen from the current samples.
	*/
	void sync_header();
	/*! Recompute depmin, depmax, and depmen only. */
	void update_dependent_stats();
	double endtime()const noexcept
        {
            return(mt0+mdt*static_cast<double>(s.size())-mdt);
        };
/*!
Extract a sample with range checking.

\exception SeisconvError if the requested sample is outside the data
   or the record is marked dead.
**/
	double operator[](size_t const sample) const;
private:
	friend boost::serialization::access;
	/* Metadata holds boost::any values that boost::serialization cannot
	handle.  The header is saved as the text form of serialize_metadata. */
	template<class Archive>
	   void save(Archive& ar,const unsigned int version) const
	{
	  ar << boost::serialization::base_object<BasicTimeSeries>(*this);
	  std::string sbuf=seisconv::utility::serialize_metadata(*this);
	  ar << sbuf;
	  ar << s;
	  ar << elog;
	};
	template<class Archive>
	   void load(Archive& ar,const unsigned int version)
	{
	  ar >> boost::serialization::base_object<BasicTimeSeries>(*this);
	  std::string sbuf;
	  ar >> sbuf;
	  this->Metadata::operator=(seisconv::utility::restore_serialized_metadata(sbuf));
	  ar >> s;
	  ar >> elog;
	};
	BOOST_SERIALIZATION_SPLIT_MEMBER()
};
}  // End seisconv::seismic namespace
#endif //end guard
