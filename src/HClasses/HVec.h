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

#ifndef __HVEC_H__
#define __HVEC_H__

#include <stdio.h>
#include <cstring>
#include <string>
#include <vector>
#include <initializer_list>
#include "HError.h"

namespace HClasses {

/// Represents a mathematical vector of doubles
class HVec
{
protected:
	double* m_data;
	size_t m_size;

public:
	/// General-purpose constructor. n specifies the initial size of the vector.
	HVec(size_t n = 0);

	/// General-purpose constructor. n specifies the initial size of the vector.
	HVec(int n);

	/// Initializer constructor. Example usage:
	///   HVec v({2.1, 3.2, 4.0, 5.7});
	HVec(const std::initializer_list<double>& list);

	/// Destructor
	virtual ~HVec();

	/// Returns the size of this vector.
	size_t size() const { return m_size; }

	/// Resizes this vector. The contents are not preserved.
	void resize(size_t n);

	/// Sets all the elements in this vector to val.
	void fill(const double val, size_t startPos = 0, size_t elements = (size_t)-1);

	/// \brief Returns a reference to the specified element.
	inline double& operator [](size_t index)
	{
		HAssert(index < m_size);
		return m_data[index];
	}

	/// \brief Returns a const reference to the specified element
	inline const double& operator [](size_t index) const
	{
		HAssert(index < m_size);
		return m_data[index];
	}

	/// Returns a pointer to the raw element values.
	double* data() { return m_data; }

	/// Returns a const pointer to the raw element values.
	const double* data() const { return m_data; }

	/// Adds another vector to this one.
	HVec& operator+=(const HVec& that);

	/// Scales this vector.
	HVec& operator*=(double scalar);

	/// Copies all the values in orig, resizing this vector to fit.
	void copy(const HVec& orig);

	/// Returns the squared Euclidean magnitude of this vector.
	double squaredMagnitude() const;

	/// Returns the squared Euclidean distance between this and that vector.
	double squaredDistance(const HVec& that) const;

	/// Returns the dot product of this and that.
	double dotProduct(const HVec& that) const;

	/// Returns the sum of the elements in this vector
	double sum() const;

	/// Prints a representation of this vector to the specified stream.
	void print(std::ostream& stream = std::cout, char separator = ',') const;

	/// Returns a string representation of this vector
	std::string to_str(char separator = ',') const;

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

private:
	HVec& operator=(const HVec& orig);
	HVec(const HVec& copyme) { throw Ex("This is not a copy constructor. Use the 'copy' method instead."); }
};


} // namespace HClasses

#endif // __HVEC_H__
