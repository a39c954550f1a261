#ifndef _SEISCONV_SOURCE_CONVOLUTION_H_
#define _SEISCONV_SOURCE_CONVOLUTION_H_
#include <string>
#include <vector>
#include "seisconv/algorithms/SourceTimeFunction.h"
#include "seisconv/algorithms/convolution.h"
#include "seisconv/seismic/Ensemble.h"
#include "seisconv/utility/AntelopePf.h"
namespace seisconv::algorithms{
/*! \brief Control parameters for convolve_source_timefunction.

halfwidth and type each hold either one value applied to every record
or one value per record.
*/
class ConvolutionParameters
{
public:
  std::vector<double> halfwidth;
  std::vector<std::string> type;
  /*! When true the process verbose switch is turned on while the
  convolution runs. */
  bool verbose;
  /*! Default has no halfwidth, type gaussian, and verbose off. */
  ConvolutionParameters();
  explicit ConvolutionParameters(const std::vector<double>& hw,
      const std::vector<std::string>& stype=std::vector<std::string>(1,"gaussian"),
      const bool verbose_output=false);
  /*! \brief Construct from a parameter file image.

  Recognized keys:
  - halfwidth (real) or a Tbl named halfwidths with one value per record.
    Required.
  - source_function_type (string) or a Tbl named source_function_types.
    Defaults to gaussian.
  - verbose (boolean).  Defaults to false.

  A Tbl overrides the scalar key of the same meaning.

  \exception InvalidArgument if no halfwidth is defined or a Tbl entry
    cannot be converted to a number.
  */
  explicit ConvolutionParameters(const seisconv::utility::AntelopePf& pf);
  ConvolutionParameters(const ConvolutionParameters& parent);
  ConvolutionParameters& operator=(const ConvolutionParameters& parent);
};

/*! \brief Convolve records with source time functions.

Each live member of d is convolved with a source time function built
from its own sample interval and the matching halfwidth and type.  The
samples the convolution moves outside the original record are attached
to the ends of the record so no energy is lost.  b, e, npts, depmin,
depmax, and depmen are updated.

The input is verified before anything is changed.  Structure (the
samples must exist and match npts) and header consistency are checked
(each honoring the process switches in state.h), and then every live
member must be an evenly sampled time series or xy record.  The checks
are disabled for the duration of the call and restored on exit.  A
failure of any check leaves d unchanged.

\param d is the ensemble to alter.
\param halfwidth is the halfwidth in seconds, one value or one per member.
\param type is the source time function name (gaussian or triangle), one
  value or one per member.

\return the source time functions used, one per member.  Dead members
  get an empty kernel.

\exception StructuralValidationError for bad structure or header data.
\exception IncompatibleRecordType for records that are not time series.
\exception UnevenSamplingError for unevenly sampled records.
\exception InvalidArgument for illegal halfwidth values or argument lengths.
\exception UnsupportedKernelType for an unknown type name.
*/
std::vector<SourceTimeFunction> convolve_source_timefunction(
    seisconv::seismic::TimeSeriesEnsemble& d,
    const std::vector<double>& halfwidth,
    const std::vector<std::string>& type=std::vector<std::string>(1,"gaussian"));
/*! Parameter object form.  Also raises the verbose switch for the call
if the parameters ask for it. */
std::vector<SourceTimeFunction> convolve_source_timefunction(
    seisconv::seismic::TimeSeriesEnsemble& d,
    const ConvolutionParameters& params);
/*! \brief LoggingEnsemble form.

Identical to the TimeSeriesEnsemble form but verbose messages are also
posted to the ensemble error log.  A dead ensemble is returned unaltered
with an empty result.
*/
std::vector<SourceTimeFunction> convolve_source_timefunction(
    seisconv::seismic::LoggingTimeSeriesEnsemble& d,
    const ConvolutionParameters& params);
}  // End seisconv::algorithms namespace
#endif
