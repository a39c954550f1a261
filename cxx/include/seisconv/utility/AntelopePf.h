#ifndef _SEISCONV_ANTELOPE_PF_H_
#define _SEISCONV_ANTELOPE_PF_H_

#include <list>
#include <map>
#include <string>
#include "seisconv/utility/Metadata.h"
namespace seisconv::utility{
/*! \brief C++ object version of an Antelope style parameter file.

   Simple attributes (key-value pairs) are posted directly to the Metadata
associative array.  The parser guesses the type of each value in the
obvious ways (periods or e/E imply real numbers, yes/no/true/false imply
booleans, pure digits imply integers, anything else is a string).  Numeric
values are also stored as strings so get_string always works for a simple
parameter.
   An Antelope Tbl (key &Tbl{ ... }) is converted to an std::list of the
lines between the curly brackets.  Nested Arr blocks are not supported
and throw an AntelopePfError.

This is the configuration format used to drive the convolution
procedures (see ConvolutionParameters).
*/
class AntelopePf : public Metadata
{
public:
    AntelopePf():Metadata(){};
    /*! \brief Construct from a file name.

      \param fname is the file to read.  If it does not end in .pf the
        extension is NOT added.

      \exception AntelopePfError if the file cannot be read or parsed.
        */
    AntelopePf(const std::string fname);
    /*! \brief Construct from a set of text lines.

      Each element is one line of a pf file.  Blank and comment lines are
      allowed.

      \param lines is the contents of a pf file split into lines.*/
    AntelopePf(const std::list<std::string>& lines);
    AntelopePf(const AntelopePf& parent);
    /*! \brief get a Tbl component by key.

      \param key is the key for the Tbl desired.
      \exception AntelopePfError will be thrown if the key
         is not present. */
    std::list<std::string> get_tbl(const std::string key) const;
    /*! Test if a Tbl with key is defined. */
    bool tbl_is_defined(const std::string key) const
    {
      return pftbls.find(key)!=pftbls.end();
    };
    AntelopePf& operator=(const AntelopePf& parent);
    /*! \brief save result in a pf format.

       Simple parameters are written as key value lines and Tbl entries
       as key &Tbl{ blocks.
          */
    void pfwrite(std::ostream& ofs) const;
private:
    std::map<std::string,std::list<std::string> > pftbls;
};
/*! \brief Error class for AntelopePf object.

  Tags errors cleanly as originating from the parameter file parser.
  */
class AntelopePfError : public SeisconvError
{
    public:
        AntelopePfError(const std::string mess)
          : SeisconvError(std::string("AntelopePfError object message=")+mess,
              ErrorSeverity::Invalid){};
};
} // End seisconv::utility namespace
#endif
