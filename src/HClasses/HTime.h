/*
  The contents of this file are dedicated by all of its authors, including

    Michael S. Gashler,
    Eric Moyer,
    anonymous contributors,

  to the public domain (http://creativecommons.org/publicdomain/zero/1.0/).

  Note that some moral obligations still exist in the absence of legal ones.
  For example, it would still be dishonest to deliberately misrepresent the
  origin of a work. Although we impose no legal requirements to obtain a
  license, it is beseeming for those who build on the works of others to
  give back useful improvements, or find a way to pay it forward. If
  you would like to cite us, a published paper about Waffles can be found
  at http://jmlr.org/papers/volume12/gashler11a/gashler11a.pdf. If you find
  our code to be useful, the Waffles team would love to hear how you use it.
*/

#ifndef __HTIME_H__
#define __HTIME_H__

#include <string>

namespace HClasses {

/// Provides some time-related functions
class HTime
{
public:
	/// Returns the number of seconds since the Epoch (midnight, Jan 1, 1970, GMT)
	/// with at least millisecond precision.
	static double seconds();

	/// Adds a string representation of the current time to pS in big Endian format. For example, if sep1="-",
	/// sep2=" ", and sep3=":", and the time is one second before 2010, then it would append a string like
	/// this to pS: "2009-12-31 23:59:59".
	static void appendTimeStampValue(std::string* pS, const char* sep1 = "-", const char* sep2 = " ", const char* sep3 = ":", bool bGreenwichMeanTime = false);
};

} // namespace HClasses

#endif // __HTIME_H__
