#include <algorithm>
#include <numeric>
#include <vector>
#include "seisconv/seismic/TimeSeries.h"
#include "seisconv/seismic/keywords.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::seismic {
using namespace std;
using namespace seisconv::utility;

TimeSeries::TimeSeries() : BasicTimeSeries(), Metadata(), elog() {
  this->put<string>(SEISMICMD_iftype, IFTYPE_timeseries);
  this->put<bool>(SEISMICMD_leven, true);
  this->set_dt(1.0);
  this->set_t0(0.0);
  this->set_npts(0);
  this->sync_header();
}
TimeSeries::TimeSeries(const size_t nsin) : BasicTimeSeries(), Metadata(), elog() {
  /* BasicTimeSeries leaves dt=1, t0=0 and the object marked dead */
  this->put<string>(SEISMICMD_iftype, IFTYPE_timeseries);
  this->put<bool>(SEISMICMD_leven, true);
  this->set_dt(this->mdt);
  this->set_t0(this->mt0);
  this->set_npts(nsin);
  this->sync_header();
}
TimeSeries::TimeSeries(const BasicTimeSeries &bd, const Metadata &md)
    : BasicTimeSeries(bd), Metadata(md), elog() {
  if (!this->is_defined(SEISMICMD_iftype))
    this->put<string>(SEISMICMD_iftype, IFTYPE_timeseries);
  if (!this->is_defined(SEISMICMD_leven))
    this->put<bool>(SEISMICMD_leven, true);
  this->set_dt(this->mdt);
  this->set_t0(this->mt0);
  this->set_npts(this->nsamp);
  this->sync_header();
}
TimeSeries::TimeSeries(const TimeSeries &tsi)
    : BasicTimeSeries(tsi), Metadata(tsi), s(tsi.s), elog(tsi.elog) {}

TimeSeries &TimeSeries::operator=(const TimeSeries &tsi) {
  if (this != &tsi) {
    this->BasicTimeSeries::operator=(tsi);
    this->Metadata::operator=(tsi);
    s = tsi.s;
    elog = tsi.elog;
  }
  return (*this);
}
void TimeSeries::set_dt(const double sample_interval) {
  this->BasicTimeSeries::set_dt(sample_interval);
  this->put<double>(SEISMICMD_dt, sample_interval);
}
void TimeSeries::set_t0(const double t0in) {
  this->BasicTimeSeries::set_t0(t0in);
  this->put<double>(SEISMICMD_t0, t0in);
}
void TimeSeries::set_npts(const size_t npts) {
  this->BasicTimeSeries::set_npts(npts);
  /* The cast avoids type mismatches on get_long for unsigned values */
  this->put<long>(SEISMICMD_npts, static_cast<long>(npts));
  std::vector<double>().swap(this->s);
  this->s.assign(npts, 0.0);
}
void TimeSeries::sync_npts() {
  if (nsamp != this->s.size()) {
    this->BasicTimeSeries::set_npts(this->s.size());
  }
  this->put<long>(SEISMICMD_npts, static_cast<long>(nsamp));
}
void TimeSeries::update_dependent_stats() {
  double dmin(0.0), dmax(0.0), dmean(0.0);
  if (s.size() > 0) {
    auto mm = std::minmax_element(s.begin(), s.end());
    dmin = *(mm.first);
    dmax = *(mm.second);
    dmean = std::accumulate(s.begin(), s.end(), 0.0) /
            static_cast<double>(s.size());
  }
  this->put<double>(SEISMICMD_depmin, dmin);
  this->put<double>(SEISMICMD_depmax, dmax);
  this->put<double>(SEISMICMD_depmen, dmean);
}
void TimeSeries::sync_header() {
  this->sync_npts();
  this->put<double>(SEISMICMD_endtime, this->endtime());
  this->update_dependent_stats();
}

double TimeSeries::operator[](size_t i) const {
  if (!mlive)
    throw SeisconvError(string("TimeSeries operator[]: attempting to access "
                               "data marked as dead"),
                        ErrorSeverity::Invalid);
  if (i >= s.size()) {
    throw SeisconvError(string("TimeSeries operator[]:  request for sample "
                               "outside range of data"),
                        ErrorSeverity::Invalid);
  }
  return (s[i]);
}

} // namespace seisconv::seismic
