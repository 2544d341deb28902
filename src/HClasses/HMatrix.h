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

#ifndef __HMATRIX_H__
#define __HMATRIX_H__

#include "HVec.h"
#include <vector>
#include <iostream>

namespace HClasses {

/// Represents a matrix or a database table of continuous values.
///
/// Elements can be accessed like this:
/// \code
/// HMatrix m(3, 7);     // Make a 3x7 matrix
/// m[2][6] = 2.1;       // Set the value in the last row and last column to 2.1
/// \endcode
///
/// Integer attributes are stored as doubles. The matrix owns its rows.
class HMatrix
{
protected:
	size_t m_cols;
	std::vector<HVec*> m_rows;

public:
	/// Makes a matrix of the specified size.
	HMatrix(size_t rows, size_t cols);

	/// Makes an empty matrix with the specified number of columns.
	HMatrix(size_t cols = 0);

	/// Initializer constructor. Every inner list becomes a row. Example usage:
	///   HMatrix m({{1.0, 2.0}, {3.0, 4.0}});
	HMatrix(const std::initializer_list<std::initializer_list<double> >& list);

	~HMatrix();

	/// Deletes all the rows and changes the number of columns.
	void resize(size_t rows, size_t cols);

	/// Adds a new row to the matrix and returns it. The contents are not initialized.
	HVec& newRow();

	/// Adds "nRows" uninitialized rows to this matrix.
	void newRows(size_t nRows);

	/// Adds a copy of the row to the matrix. Throws if its size does not match the column count.
	HVec& copyRow(const HVec& row);

	/// Deletes all the rows in this matrix.
	void flush();

	/// Returns the number of rows in the matrix
	size_t rows() const { return m_rows.size(); }

	/// Returns the number of columns in the matrix
	size_t cols() const { return m_cols; }

	/// Returns a reference to the specified row
	inline HVec& row(size_t index) { return *m_rows[index]; }

	/// Returns a const reference to the specified row
	inline const HVec& row(size_t index) const { return *m_rows[index]; }

	/// Returns a reference to the specified row
	inline HVec& operator [](size_t index)
	{
		HAssert(index < m_rows.size());
		return *m_rows[index];
	}

	/// Returns a const reference to the specified row
	inline const HVec& operator [](size_t index) const
	{
		HAssert(index < m_rows.size());
		return *m_rows[index];
	}

	/// Copies all the rows of that matrix into this one.
	void copy(const HMatrix& that);

	/// Computes the arithmetic mean of all the rows.
	void centroid(HVec& outCentroid) const;

	/// Computes the arithmetic mean of the specified rows.
	/// Throws if the list is empty.
	void centroid(HVec& outCentroid, const std::vector<size_t>& indexes) const;

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

private:
	HMatrix(const HMatrix& that) { throw Ex("Big objects should generally be passed by reference, not by value"); }
	HMatrix& operator=(const HMatrix& orig);
};

} // namespace HClasses

#endif // __HMATRIX_H__
