///////////////////////////////////////////////////////////////////////////////
///
///	\file    SparseMatrix.h
///	\author  Paul Ullrich
///	\version August 25, 2014
///
///	<remarks>
///		Copyright 2000-2014 Paul Ullrich
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _SPARSEMATRIX_H_
#define _SPARSEMATRIX_H_

#include "Defines.h"
#include "Exception.h"
#include "DataArray1D.h"

#include <map>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A sparse matrix of remapping weights with missing-aware application.
///	</summary>
template <typename DataType>
class SparseMatrix {

public:
	///	<summary>
	///		Sparse matrix map.
	///	</summary>
	typedef typename std::pair<int, int> IndexType;
	typedef typename std::map<IndexType, DataType> SparseMap;
	typedef typename SparseMap::value_type SparseMapPair;
	typedef typename SparseMap::iterator SparseMapIterator;
	typedef typename SparseMap::const_iterator SparseMapConstIterator;
	typedef typename std::pair<SparseMapIterator, bool> SparseMapInsertResult;

public:
	///	<summary>
	///		Default constructor.
	///	</summary>
	SparseMatrix() :
		m_nRows(0),
		m_nCols(0)
	{ }

public:
	///	<summary>
	///		Accessor.  Repeated entries accumulate.
	///	</summary>
	DataType & operator()(int iRow, int iCol) {
		if ((iRow < 0) || (iCol < 0)) {
			_EXCEPTION2("Negative sparse matrix index (%i, %i)", iRow, iCol);
		}

		SparseMapIterator iter = m_mapEntries.find(IndexType(iRow, iCol));
		if (iter != m_mapEntries.end()) {
			return iter->second;
		}

		if (iRow >= m_nRows) {
			m_nRows = iRow + 1;
		}
		if (iCol >= m_nCols) {
			m_nCols = iCol + 1;
		}

		SparseMapInsertResult result =
			m_mapEntries.insert(
				SparseMapPair(
					IndexType(iRow, iCol), static_cast<DataType>(0)));

		return result.first->second;
	}

	///	<summary>
	///		Clear the operator.
	///	</summary>
	void Clear() {
		m_nRows = 0;
		m_nCols = 0;
		m_mapEntries.clear();
	}

public:
	///	<summary>
	///		Apply the sparse matrix to a field that may contain missing
	///		values.  Weights on missing source values are dropped and the
	///		remaining weights renormalised; a target row with no valid
	///		source weight is set to FillValue.
	///	</summary>
	template <typename ValueType>
	void ApplyWithMissing(
		const ValueType * dataIn,
		size_t sInSize,
		ValueType * dataOut,
		size_t sOutSize
	) const {
		if (sInSize < static_cast<size_t>(m_nCols)) {
			_EXCEPTION2("Input field too small for sparse matrix (%lu < %i)",
				sInSize, m_nCols);
		}
		if (sOutSize < static_cast<size_t>(m_nRows)) {
			_EXCEPTION2("Output field too small for sparse matrix (%lu < %i)",
				sOutSize, m_nRows);
		}

		DataArray1D<double> dSum(sOutSize);
		DataArray1D<double> dWeight(sOutSize);

		SparseMapConstIterator iter = m_mapEntries.begin();
		for (; iter != m_mapEntries.end(); iter++) {
			double dValue = static_cast<double>(dataIn[iter->first.second]);
			if (IsFillValue(dValue)) {
				continue;
			}
			dSum(iter->first.first) += iter->second * dValue;
			dWeight(iter->first.first) += iter->second;
		}

		for (size_t i = 0; i < sOutSize; i++) {
			if (dWeight(i) > HighTolerance) {
				dataOut[i] = static_cast<ValueType>(dSum(i) / dWeight(i));
			} else {
				dataOut[i] = static_cast<ValueType>(FillValue);
			}
		}
	}

protected:
	///	<summary>
	///		Number of rows in the sparse matrix.
	///	</summary>
	int m_nRows;

	///	<summary>
	///		Number of columns in the sparse matrix.
	///	</summary>
	int m_nCols;

	///	<summary>
	///		Entries of the sparse matrix.
	///	</summary>
	SparseMap m_mapEntries;
};

///////////////////////////////////////////////////////////////////////////////

#endif

