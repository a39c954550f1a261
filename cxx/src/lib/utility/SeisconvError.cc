#include <string>
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::utility {
using namespace std;
ErrorSeverity string2severity(const string howbad) {
  ErrorSeverity badness;
  if (howbad == "Fatal") {
    badness = ErrorSeverity::Fatal;
  } else if (howbad == "Invalid") {
    badness = ErrorSeverity::Invalid;
  } else if (howbad == "Suspect") {
    badness = ErrorSeverity::Suspect;
  } else if (howbad == "Complaint") {
    badness = ErrorSeverity::Complaint;
  } else if (howbad == "Debug") {
    badness = ErrorSeverity::Debug;
  } else if (howbad == "Informational") {
    badness = ErrorSeverity::Informational;
  } else {
    /* An unknown keyword can only come from a coding error */
    badness = ErrorSeverity::Fatal;
  }
  return badness;
}
string severity2string(const ErrorSeverity es) {
  switch (es) {
  case ErrorSeverity::Fatal:
    return string("Fatal");
  case ErrorSeverity::Invalid:
    return string("Invalid");
  case ErrorSeverity::Suspect:
    return string("Suspect");
  case ErrorSeverity::Complaint:
    return string("Complaint");
  case ErrorSeverity::Debug:
    return string("Debug");
  case ErrorSeverity::Informational:
    return string("Informational");
  default:
    return string("Fatal");
  };
}
} // namespace seisconv::utility
