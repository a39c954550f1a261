#ifndef _SEISCONV_STATE_H_
#define _SEISCONV_STATE_H_
namespace seisconv::utility{
/* Process wide switches.  The structure and header checks run by
default on every call to a procedure that validates an ensemble.  A
procedure that has already validated its input turns them off while it
works so lower level calls do not repeat the checks.  These are not
thread safe. */

/*! Return true if structural checks of ensembles are enabled. */
bool structure_check_state();
/*! Set the structural check switch and return the previous value. */
bool structure_check_state(const bool newstate);
/*! Return true if header consistency checks are enabled. */
bool header_check_state();
/*! Set the header check switch and return the previous value. */
bool header_check_state(const bool newstate);
/*! Return true if procedures should write progress messages. */
bool seisconv_verbose();
/*! Set the verbose switch and return the previous value. */
bool set_seisconv_verbose(const bool newstate);

/*! \brief Scoped save and restore of the process wide switches.

The constructor saves all three switches.  The destructor restores them
so any exit from the enclosing block, including an exception, leaves the
switches as they were on entry.  Use the set methods to change a switch
for the lifetime of the guard.
*/
class ScopedCheckState
{
public:
  ScopedCheckState();
  ~ScopedCheckState();
  /*! Disable structure and header checks until the guard is destroyed. */
  void disable_checks();
  void set_verbose(const bool newstate);
  ScopedCheckState(const ScopedCheckState&) = delete;
  ScopedCheckState& operator=(const ScopedCheckState&) = delete;
private:
  bool saved_structure;
  bool saved_header;
  bool saved_verbose;
};
} // End seisconv::utility namespace
#endif
