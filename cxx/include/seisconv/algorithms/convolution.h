#ifndef _SEISCONV_CONVOLUTION_H_
#define _SEISCONV_CONVOLUTION_H_
#include <string>
#include <vector>
#include "seisconv/algorithms/SourceTimeFunction.h"
#include "seisconv/seismic/Ensemble.h"
#include "seisconv/seismic/TimeSeries.h"
#include "seisconv/seismic/header.h"
namespace seisconv::algorithms{
/*! Thrown when one or more records hold data that are not a time series
(iftype other than itime or ixy). */
class IncompatibleRecordType : public seisconv::seismic::RecordBatchError
{
public:
  IncompatibleRecordType(const std::vector<size_t>& badrecs)
    : seisconv::seismic::RecordBatchError("IncompatibleRecordType",badrecs,
        "Illegal iftype.  Source time function convolution requires iftype itime or ixy"){};
};
/*! Thrown when one or more records are not evenly sampled (leven false). */
class UnevenSamplingError : public seisconv::seismic::RecordBatchError
{
public:
  UnevenSamplingError(const std::vector<size_t>& badrecs)
    : seisconv::seismic::RecordBatchError("UnevenSamplingError",badrecs,
        "Illegal operation on unevenly spaced record(s)"){};
};

/*! \brief Verify records are eligible for time domain convolution.

All live members are scanned.  Members with an iftype other than itime or
ixy are reported together in one IncompatibleRecordType.  If all types
are acceptable, members with leven false are reported together in one
UnevenSamplingError.  Dead members are ignored.  Read only.
*/
void validate_convolution_inputs(const seisconv::seismic::TimeSeriesEnsemble& d);

/*! \brief Compute the sample shift that aligns a kernel's time 0.

A kernel sampled on times t has its time 0 at sample -round(t[0]/delta).
The returned value is round(t[0]/delta), with halves rounded away from
zero.  The value is negative for a centered kernel.

\exception InvalidArgument if t is empty or delta is not positive.
*/
long resolve_delay(const std::vector<double>& t, const double delta);
/*! Vector form of resolve_delay.  t and delta must be the same length. */
std::vector<long> resolve_delays(const std::vector<std::vector<double>>& t,
    const std::vector<double>& delta);
/*! \brief Delays of a set of kernels.

Empty kernels (those for dead members) get a delay of 0.
*/
std::vector<long> resolve_delays(const std::vector<SourceTimeFunction>& kernels);

/*! \brief Samples of a convolution that fall outside the record.

beginning holds the samples that fall before the first sample of the
record and ending the samples after the last.  Either can be empty.
*/
class FinalConditions
{
public:
  std::vector<double> ending;
  std::vector<double> beginning;
  FinalConditions(){};
  FinalConditions(const FinalConditions& parent)
    : ending(parent.ending),beginning(parent.beginning){};
  FinalConditions& operator=(const FinalConditions& parent)
  {
    if(this!=(&parent))
    {
      ending=parent.ending;
      beginning=parent.beginning;
    }
    return *this;
  };
};

/*! \brief Convolve each member of an ensemble with its kernel.

Computes the full linear convolution of each live member with the matching
kernel in the time domain.  Full convolution sample j is placed at record
sample j+delays[i].  Samples that land inside the record replace the
original samples so the record keeps its length and begin time.  Samples
that land before the record or after it are returned as the beginning and
ending tails.  Positions spanned by a tail that receive no contribution
are 0, so the sum of the record plus both tails always equals the sum of
the full convolution.  Header statistics of each modified record are
refreshed.  Dead members are skipped and get empty tails.

\param d is the ensemble to alter.
\param kernels holds one kernel per member.
\param delays holds one delay per member (see resolve_delays).

\return one FinalConditions object per member.

\exception InvalidArgument if the argument lengths do not match the
  ensemble size, if a kernel for a live member is empty, or if a kernel
  sample interval differs from the record sample interval.  All checks
  are done before any member is modified.
*/
std::vector<FinalConditions> convolve(seisconv::seismic::TimeSeriesEnsemble& d,
    const std::vector<SourceTimeFunction>& kernels,
    const std::vector<long>& delays);

/*! Which end of a record attach adds samples to. */
enum class AttachPosition
{
  Beginning,
  Ending
};
/*! \brief Extend a record with additional samples.

Adding samples to the beginning moves b back by the number of samples
times delta.  Adding to the end moves e forward.  npts, e, depmin, depmax,
and depmen are recomputed.  An empty samples vector changes nothing.
*/
void attach(seisconv::seismic::TimeSeries& d, const AttachPosition where,
    const std::vector<double>& samples);
/*! \brief Attach tails to every member of an ensemble.

ending[i] is appended to and beginning[i] prepended to member i.  Dead
members are skipped.

\exception InvalidArgument if ending or beginning do not have one entry
  per member.  The check is done before any member is modified.
*/
void attach(seisconv::seismic::TimeSeriesEnsemble& d,
    const std::vector<std::vector<double>>& ending,
    const std::vector<std::vector<double>>& beginning);
/*! Attach the tails returned by convolve. */
void attach(seisconv::seismic::TimeSeriesEnsemble& d,
    const std::vector<FinalConditions>& fc);
}  // End seisconv::algorithms namespace
#endif
