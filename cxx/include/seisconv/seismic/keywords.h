#ifndef _SEISCONV_KEYWORDS_H_
#define _SEISCONV_KEYWORDS_H_
#include <string>
/*! \brief Define header (Metadata) keys.

This include file defines a set of const std::string values that serve as
keys to Metadata get and put calls for waveform records.  They are placed
in this one file so the names can be changed in one place.  The names
follow the SAC header conventions used by most seismology tools.
*/
namespace seisconv::seismic{
/*! Number of data samples.*/
const std::string SEISMICMD_npts("npts");
/*! data sample interval in seconds.*/
const std::string SEISMICMD_dt("delta");
/*! Time of first sample of data (begin time)*/
const std::string SEISMICMD_t0("b");
/*! Time of last sample of data (end time)*/
const std::string SEISMICMD_endtime("e");
/*! Minimum value of the dependent variable (sample values)*/
const std::string SEISMICMD_depmin("depmin");
/*! Maximum value of the dependent variable*/
const std::string SEISMICMD_depmax("depmax");
/*! Mean value of the dependent variable*/
const std::string SEISMICMD_depmen("depmen");
/*! Type of data in the record - one of the IFTYPE values below*/
const std::string SEISMICMD_iftype("iftype");
/*! Boolean that is true when samples are evenly spaced in time*/
const std::string SEISMICMD_leven("leven");

/* Values of the iftype header field */
/*! time series */
const std::string IFTYPE_timeseries("itime");
/*! general x versus y data */
const std::string IFTYPE_xy("ixy");
/*! spectrum stored as real and imaginary parts */
const std::string IFTYPE_realimag("irlim");
/*! spectrum stored as amplitude and phase */
const std::string IFTYPE_ampphase("iamph");
/*! general x,y,z data */
const std::string IFTYPE_xyz("ixyz");
}
#endif
