#ifndef _SEISCONV_BASICTIMESERIES_H_
#define _SEISCONV_BASICTIMESERIES_H_
#include <math.h>
#include <stddef.h>
#include <boost/serialization/serialization.hpp>
namespace seisconv::seismic{
/*! \brief Base class for time series objects.

Defines the attributes shared by all data sampled on a 1d, uniform grid:
a sample interval, the time of the first sample, the number of samples,
and a live/dead state.  Dead data are carried along but ignored by
processing procedures.
**/
class BasicTimeSeries
{
public:
/*!
Default constructor.  Data are marked dead with dt=1, t0=0 and no samples.
**/
	BasicTimeSeries();
	BasicTimeSeries(const BasicTimeSeries&);
	virtual ~BasicTimeSeries(){};
/*!
Get the time of sample i.
**/
	double time(const int i)const
        {
            return(mt0+mdt*static_cast<double>(i));
        };
/*!
Inverse of time function.  The returned number is not tested against
the data range.
**/
	int sample_number(double t)const
        {
            return(static_cast<int>(round((t-mt0)/mdt)));
        };
/*!
Returns the time of the last data sample.
**/
	double endtime()const noexcept
        {
            return(mt0+mdt*static_cast<double>(nsamp)-mdt);
        };
	/*! Returns true of data are marked valid (live).  */
	bool live()const{return this->mlive;};
	/*! Return true if the data have been marked bad (killed) - inverse of live()*/
	bool dead()const{return !(this->mlive);};
	/*! Mark these data bad. */
	void kill(){this->mlive=false;};
	/*! Inverse of kill. */
	void set_live(){this->mlive=true;};
	/*! Return the data sample interval. */
	double dt()const {return this->mdt;};
	/*! Return the number of points in the data series. */
	size_t npts()const {return nsamp;};
	/*! Return time of first data sample. */
	double t0()const {return this->mt0;};
	/*! \brief Set the sample interval.

	Virtual because children need to keep header copies in sync.
	*/
	virtual void set_dt(const double sample_interval)
	{
		mdt=sample_interval;
	};
	virtual void set_npts(const size_t npts)
	{
		nsamp=npts;
	};
	virtual void set_t0(const double t0in)
	{
		mt0=t0in;
	};
	BasicTimeSeries& operator=(const BasicTimeSeries& parent);

protected:
	bool mlive;
	double mdt;
	double mt0;
	size_t nsamp;
private:
	friend boost::serialization::access;
	template<class Archive>
	   void serialize(Archive& ar,const unsigned int version)
	{
	  ar & mlive;
	  ar & mdt;
	  ar & nsamp;
	  ar & mt0;
	};
};
}
#endif   // End guard
