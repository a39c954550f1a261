#ifndef _SEISCONV_ERROR_H_
#define _SEISCONV_ERROR_H_
#include <iostream>
#include <exception>
#include <string>
namespace seisconv::utility {
/*! \brief Severity code for error messages.

This is an enum class to keep these common words from colliding with
anything else.  Every SeisconvError carries one of these. */
enum class ErrorSeverity
{
	Fatal,
	Invalid,
	Suspect,
	Complaint,
	Debug,
	Informational
};

/*! Convert the keyword in a message string to an ErrorSeverity.*/
ErrorSeverity string2severity(const std::string howbad);
/*! Inverse of string2severity*/
std::string severity2string(const ErrorSeverity es);

/*! \brief Base class for error object thrown by seisconv library routines.

 The base object contains a message and a severity level.  Children
 specialize the message for a particular class of failure so handlers can
 catch the exact kind they care about or this base to catch them all.
**/
class SeisconvError : public std::exception
{
public:
/*!
 Default constructor built inline.
**/
	SeisconvError(){
		message="seisconv library error";
		badness=ErrorSeverity::Fatal;
		full_message.assign(message + ":" + severity2string(badness));
	};
/*! \brief Construct from a std::string with badness defined by a keyword.

\param mess is the error message posted.
\param howbad is a string to translate to one of the allowed enum values:
	Fatal,Invalid,Suspect,Complaint,Debug,Informational.
**/
	SeisconvError(const std::string mess,const char *howbad){
		message=mess;
		badness=string2severity(std::string(howbad));
		full_message.assign(message + ":" + severity2string(badness));
	};
/*! Construct from a string with enum defining severity.

This should be the normal form of this error object to throw.

\param mess - is the error message to be posted.
\param s is the severity enum (default Invalid).
*/
	SeisconvError(const std::string mess,const ErrorSeverity s=ErrorSeverity::Invalid)
        {
            message=mess;
            badness=s;
	    full_message.assign(message + ":" + severity2string(badness));
        };
	virtual ~SeisconvError(){};
/*!
 Sends error message to standard error.
**/
	void log_error(){
	  std::cerr << message << std::endl;
	};
/*! Overloaded method for sending error message to other than stderr. */
	void log_error(std::ostream& ofs)
	{
		ofs << message <<std::endl;
	}
/*! Overrides std::exception to return the message with severity appended. */
	const char * what() const noexcept{return full_message.c_str();};
	/*! Return error severity as the enum value. */
	ErrorSeverity severity() const {return badness;};
	/*! Return only the raw message string. */
	std::string core_message() const {return message;};
protected:
	std::string message;
	ErrorSeverity badness;
	/*! message with severity appended - returned by what */
	std::string full_message;
	/*! Children that build message after the base constructor call this. */
	void set_message(const std::string mess)
	{
		message=mess;
		full_message.assign(message + ":" + severity2string(badness));
	};
};
/*! \brief Error thrown for an argument with the wrong size, type or value.

Used for cardinality errors in per-record argument lists and for
nonsensical numeric arguments (e.g. a negative half width).  */
class InvalidArgument : public SeisconvError
{
public:
	InvalidArgument(const std::string mess)
		: SeisconvError(std::string("InvalidArgument:  ")+mess,ErrorSeverity::Invalid){};
};
}  // End seisconv::utility namespace
#endif
